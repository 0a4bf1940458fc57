#include "workpool/analysis/file_collector.hpp"
#include "workpool/analysis/routine_registry.hpp"
#include "workpool/common/logging.hpp"
#include "workpool/common/pool_errors.hpp"

#include <filesystem>
#include <set>
#include <system_error>

namespace fs = std::filesystem;

namespace workpool
{

namespace
{

bool ends_with(const std::string& text, const std::string& suffix)
{
    return text.size() >= suffix.size()
        && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool is_bundle(const std::string& filename)
{
    return ends_with(filename, ".min.js") || ends_with(filename, ".bundle.js");
}

} // namespace

std::vector<std::string> CollectOptions::default_extensions()
{
    return {".ts", ".tsx", ".js", ".jsx", ".py", ".go", ".rs", ".java",
            ".c", ".cc", ".cpp", ".h", ".hpp"};
}

std::vector<std::string> CollectOptions::default_ignore_dirs()
{
    return {"node_modules", "dist", ".next", "build", ".git", "out", "coverage",
            ".odavl", "reports", "vendor", "__pycache__", ".pytest_cache", "target"};
}

void validate(const CollectOptions& options)
{
    for (const auto& ext : options.extensions)
    {
        if (ext.size() < 2 || ext.front() != '.')
        {
            throw ConfigurationError("CollectOptions: invalid extension '" + ext + "'");
        }
    }
}

std::vector<std::string> collect_files(const std::string& root, const CollectOptions& options)
{
    validate(options);

    const fs::path root_path = fs::absolute(root);
    if (!fs::is_directory(root_path))
    {
        throw fs::filesystem_error(
            "workspace root is not a directory", root_path,
            std::make_error_code(std::errc::not_a_directory));
    }

    std::set<std::string> extensions;
    for (const auto& ext : options.extensions)
    {
        extensions.insert(extension_of("x" + ext));
    }
    const std::set<std::string> ignore_dirs(options.ignore_dirs.begin(), options.ignore_dirs.end());

    std::set<std::string> found;
    std::error_code ec;
    fs::recursive_directory_iterator it(
        root_path, fs::directory_options::skip_permission_denied, ec);
    if (ec)
    {
        throw fs::filesystem_error("cannot read workspace root", root_path, ec);
    }

    fs::recursive_directory_iterator end;
    while (it != end)
    {
        const fs::path& path = it->path();
        const std::string name = path.filename().string();
        const bool hidden = options.skip_hidden && !name.empty() && name.front() == '.';

        std::error_code type_ec;
        if (it->is_directory(type_ec))
        {
            if (hidden || ignore_dirs.count(name) != 0)
            {
                it.disable_recursion_pending();
            }
        }
        else if (it->is_regular_file(type_ec) && !hidden && !is_bundle(name) &&
                 (extensions.empty() || extensions.count(extension_of(name)) != 0))
        {
            found.insert(path.lexically_normal().string());
        }

        it.increment(ec);
        if (ec)
        {
            // Permission errors are skipped by the iterator; anything else ends the walk.
            logger()->warn("[FileCollector] Stopped walking {} after {} files, result is partial: {}",
                           root_path.string(), found.size(), ec.message());
            break;
        }
    }

    return std::vector<std::string>(found.begin(), found.end());
}

} // namespace workpool
