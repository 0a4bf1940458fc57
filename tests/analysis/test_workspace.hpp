/**
 * @file test_workspace.hpp
 * @brief Temporary directory tree for analysis tests.
 */
#pragma once
#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace workpool::test_support
{

/**
 * @brief Creates a unique directory under the system temp dir and removes it
 *        on destruction.
 */
class TestWorkspace
{
public:
    TestWorkspace()
    {
        static std::atomic<int> s_counter{0};
        m_root = std::filesystem::temp_directory_path() /
                 ("workpool-test-" + std::to_string(::getpid()) + "-" + std::to_string(s_counter++));
        std::filesystem::create_directories(m_root);
    }

    ~TestWorkspace()
    {
        std::error_code ec;
        std::filesystem::remove_all(m_root, ec);
    }

    TestWorkspace(const TestWorkspace&) = delete;
    TestWorkspace& operator=(const TestWorkspace&) = delete;

    /**
     * @brief Write @p content to @p relative, creating parent directories.
     * @return Absolute path of the file.
     */
    std::string write(const std::string& relative, const std::string& content = "")
    {
        auto path = m_root / relative;
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out(path);
        out << content;
        return path.lexically_normal().string();
    }

    std::string root() const
    {
        return m_root.string();
    }

    std::string path(const std::string& relative) const
    {
        return (m_root / relative).lexically_normal().string();
    }

private:
    std::filesystem::path m_root;
};

} // namespace workpool::test_support
