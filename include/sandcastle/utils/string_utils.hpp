/**
 * @file string_utils.hpp
 * @brief String helpers for command building, validation and sandbox paths
 *
 * Provides trimming, splitting and joining, POSIX shell quoting for commands
 * handed to `sh -c`, validation of sandbox and package names, and the
 * path normalisation used to keep file transfers inside a sandbox working area.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <optional>

namespace sandcastle {
namespace utils {

/**
 * @class StringUtils
 * @brief Stateless string utilities
 *
 * All methods are static - no instantiation required.
 *
 * **Usage Example**:
 * @code
 * auto target = StringUtils::ResolveInside("/app/results", "data/input.csv");
 * // target == "/app/results/data/input.csv"
 *
 * auto escaped = StringUtils::ResolveInside("/app/results", "../../etc/passwd");
 * // escaped == std::nullopt
 * @endcode
 */
class StringUtils {
public:
    /***************************************************************************
     * Basic Manipulation
     ***************************************************************************/

    static std::string Trim(const std::string& str);
    static std::string ToLower(const std::string& str);

    /**
     * @brief Split on a delimiter, skipping empty tokens
     */
    static std::vector<std::string> Split(const std::string& str, char delimiter);

    /**
     * @brief Split into lines, keeping empty lines out
     */
    static std::vector<std::string> SplitLines(const std::string& str);

    static std::string Join(const std::vector<std::string>& strings, const std::string& delimiter);
    static bool StartsWith(const std::string& str, const std::string& prefix);
    static bool Contains(const std::string& str, const std::string& substring);

    static std::string Truncate(const std::string& str, std::size_t max_length,
                                const std::string& suffix = "...");

    /**
     * @brief Keep the last @p max_length characters, prefixed with "..."
     *
     * Used to attach the tail of installer output to failure reasons.
     */
    static std::string Tail(const std::string& str, std::size_t max_length);

    /***************************************************************************
     * Validation
     ***************************************************************************/

    /**
     * @brief Sandbox names: 1-64 chars of [A-Za-z0-9_.-], not starting with '.' or '-'
     */
    static bool IsValidSandboxName(const std::string& name);

    /**
     * @brief Package specs: non-empty, no whitespace or shell metacharacters,
     *        not starting with '-' (prevents option injection)
     */
    static bool IsValidPackageSpec(const std::string& spec);

    /**
     * @brief Canonical package name for comparisons
     *
     * Lowercases and folds '_' and '.' to '-', strips any version specifier.
     */
    static std::string NormalizePackageName(const std::string& spec);

    /***************************************************************************
     * Sandbox Paths
     ***************************************************************************/

    /**
     * @brief Resolve @p path against @p base and require it stays inside @p base
     *
     * Relative paths are joined to @p base, then "." and ".." components are
     * folded lexically. Returns std::nullopt when the result escapes @p base.
     * The base itself is considered inside.
     *
     * @param base Absolute POSIX directory (e.g. "/app/results")
     * @param path Absolute or relative POSIX path
     */
    static std::optional<std::string> ResolveInside(const std::string& base, const std::string& path);

    /**
     * @brief Parent directory of an absolute POSIX path ("/" for top-level)
     */
    static std::string ParentPath(const std::string& path);
};

} // namespace utils
} // namespace sandcastle
