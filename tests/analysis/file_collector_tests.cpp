#include <gtest/gtest.h>
#include "workpool/analysis/file_collector.hpp"
#include "workpool/common/pool_errors.hpp"
#include "workpool/common/logging.hpp"
#include "test_workspace.hpp"

#include <fcntl.h>
#include <sys/resource.h>
#include <unistd.h>

using namespace workpool;
using workpool::test_support::TestWorkspace;

namespace
{

/**
 * @brief Leaves this process @p spare free descriptors, then collects
 *        @p root. Exits 0 when fewer than @p total files come back.
 */
[[noreturn]] void collect_with_spare_descriptors(
    const std::string& root, std::size_t total, int spare)
{
    logger();
    int lowest_free = ::open("/dev/null", O_RDONLY);
    if (lowest_free < 0)
    {
        ::_exit(2);
    }
    ::close(lowest_free);

    struct rlimit limit{};
    if (::getrlimit(RLIMIT_NOFILE, &limit) != 0)
    {
        ::_exit(2);
    }
    limit.rlim_cur = static_cast<rlim_t>(lowest_free + spare);
    if (::setrlimit(RLIMIT_NOFILE, &limit) != 0)
    {
        ::_exit(2);
    }

    auto files = collect_files(root);
    ::_exit(files.size() < total ? 0 : 1);
}

} // namespace

class FileCollectorTests : public ::testing::Test
{
protected:
    TestWorkspace workspace;
};

TEST_F(FileCollectorTests, EmptyWorkspace_ReturnsNothing)
{
    EXPECT_TRUE(collect_files(workspace.root()).empty());
}

TEST_F(FileCollectorTests, MissingRoot_Throws)
{
    EXPECT_THROW(collect_files(workspace.path("does-not-exist")), std::filesystem::filesystem_error);
}

TEST_F(FileCollectorTests, RootIsAFile_Throws)
{
    std::string file = workspace.write("a.ts");
    EXPECT_THROW(collect_files(file), std::filesystem::filesystem_error);
}

TEST_F(FileCollectorTests, CollectsMatchingExtensionsSorted)
{
    std::string b = workspace.write("src/b.ts");
    std::string a = workspace.write("src/a.py");
    std::string c = workspace.write("lib/deep/c.cpp");
    workspace.write("notes.txt");
    workspace.write("Makefile");

    auto files = collect_files(workspace.root());
    std::vector<std::string> expected{c, a, b};
    std::sort(expected.begin(), expected.end());
    EXPECT_EQ(files, expected);
}

TEST_F(FileCollectorTests, SkipsIgnoredDirectoriesAnywhere)
{
    std::string kept = workspace.write("src/index.js");
    workspace.write("node_modules/pkg/index.js");
    workspace.write("src/node_modules/inner.js");
    workspace.write("dist/bundle.js");
    workspace.write("build/gen.cpp");
    workspace.write("target/debug/main.rs");
    workspace.write("pkg/__pycache__/mod.py");

    EXPECT_EQ(collect_files(workspace.root()), std::vector<std::string>{kept});
}

TEST_F(FileCollectorTests, SkipsHiddenAndMinifiedFiles)
{
    std::string kept = workspace.write("app.js");
    workspace.write(".eslintrc.js");
    workspace.write(".hidden/x.ts");
    workspace.write("vendor.min.js");
    workspace.write("app.bundle.js");

    EXPECT_EQ(collect_files(workspace.root()), std::vector<std::string>{kept});
}

TEST_F(FileCollectorTests, CustomOptions_AreHonored)
{
    std::string txt = workspace.write("docs/readme.txt");
    std::string hidden = workspace.write(".config/settings.txt");
    workspace.write("src/a.ts");
    std::string dist = workspace.write("dist/out.txt");

    CollectOptions options;
    options.extensions = {".TXT"};
    options.ignore_dirs = {};
    options.skip_hidden = false;

    std::vector<std::string> expected{txt, hidden, dist};
    std::sort(expected.begin(), expected.end());
    EXPECT_EQ(collect_files(workspace.root(), options), expected);
}

TEST_F(FileCollectorTests, EmptyExtensionList_CollectsEveryFile)
{
    std::string a = workspace.write("a.unknown");
    std::string b = workspace.write("Makefile");
    CollectOptions options;
    options.extensions.clear();

    std::vector<std::string> expected{a, b};
    std::sort(expected.begin(), expected.end());
    EXPECT_EQ(collect_files(workspace.root(), options), expected);
}

TEST_F(FileCollectorTests, InvalidExtension_Throws)
{
    CollectOptions options;
    options.extensions = {"ts"};
    EXPECT_THROW(collect_files(workspace.root(), options), ConfigurationError);
}

TEST_F(FileCollectorTests, RelativeRoot_YieldsAbsolutePaths)
{
    workspace.write("a.ts");
    auto previous = std::filesystem::current_path();
    std::filesystem::current_path(workspace.root());
    auto files = collect_files(".");
    std::filesystem::current_path(previous);

    ASSERT_EQ(files.size(), 1u);
    EXPECT_TRUE(std::filesystem::path(files[0]).is_absolute());
}

TEST_F(FileCollectorTests, WalkError_ReturnsPartialResultWithWarning)
{
    workspace.write("d1/a.ts");
    workspace.write("d1/d2/b.ts");
    workspace.write("d1/d2/d3/c.ts");
    workspace.write("d1/d2/d3/d4/d.ts");
    workspace.write("d1/d2/d3/d4/d5/e.ts");

    EXPECT_EXIT(collect_with_spare_descriptors(workspace.root(), 5, 2),
                ::testing::ExitedWithCode(0), "Stopped walking .* result is partial");
}
