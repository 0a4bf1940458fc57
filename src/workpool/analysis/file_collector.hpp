/**
 * @file file_collector.hpp
 * @brief Enumerate analyzable source files under a workspace.
 */
#pragma once
#include "workpool/common/common.hpp"

namespace workpool
{

/**
 * @brief Options for collect_files().
 */
struct CollectOptions
{
    /**
     * @brief Extensions to include, with the leading dot. Empty means every
     *        file.
     */
    std::vector<std::string> extensions = default_extensions();

    /**
     * @brief Directory names pruned wherever they occur.
     */
    std::vector<std::string> ignore_dirs = default_ignore_dirs();

    /**
     * @brief Skip dot-files and dot-directories.
     */
    bool skip_hidden{true};

    static std::vector<std::string> default_extensions();
    static std::vector<std::string> default_ignore_dirs();
};

/**
 * @brief Check a CollectOptions.
 * @throws ConfigurationError if an extension does not start with a dot.
 */
void validate(const CollectOptions& options);

/**
 * @brief Recursively collect files under @p root.
 *
 * @details
 * Build outputs and minified bundles (`*.min.js`, `*.bundle.js`) are skipped.
 * Subdirectories that cannot be read are skipped with a debug log.
 *
 * @return Absolute, sorted, de-duplicated paths.
 * @throws std::filesystem::filesystem_error if @p root does not exist or is
 *         not a directory.
 */
std::vector<std::string> collect_files(const std::string& root, const CollectOptions& options = {});

} // namespace workpool
