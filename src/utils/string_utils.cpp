/**
 * @file string_utils.cpp
 * @brief Implementation of string, validation and sandbox path utilities
 *
 * **Path confinement**:
 * File transfers name paths inside a sandbox. ResolveInside folds the path
 * lexically (no container round trip) and rejects anything that leaves the
 * working area, so `../../etc/passwd` is refused before a byte moves.
 * Symlinks inside the container are not followed here; the container
 * boundary is the isolation layer for those.
 *
 * @date 2025
 */

#include "sandcastle/utils/string_utils.hpp"

#include <sstream>
#include <algorithm>
#include <cctype>

namespace sandcastle {
namespace utils {

namespace {

// Folds "." and ".." out of an absolute path. nullopt when ".." climbs above "/".
std::optional<std::vector<std::string>> FoldComponents(const std::string& absolute) {
    std::vector<std::string> stack;
    std::size_t pos = 0;
    while (pos <= absolute.size()) {
        auto next = absolute.find('/', pos);
        if (next == std::string::npos) {
            next = absolute.size();
        }
        std::string part = absolute.substr(pos, next - pos);
        pos = next + 1;

        if (part.empty() || part == ".") {
            continue;
        }
        if (part == "..") {
            if (stack.empty()) {
                return std::nullopt;
            }
            stack.pop_back();
            continue;
        }
        stack.push_back(part);
    }
    return stack;
}

std::string ToAbsolute(const std::vector<std::string>& components) {
    std::string out;
    for (const auto& part : components) {
        out += "/";
        out += part;
    }
    return out.empty() ? "/" : out;
}

} // anonymous namespace

// ============================================================================
// BASIC MANIPULATION
// ============================================================================

std::string StringUtils::Trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

std::string StringUtils::ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::vector<std::string> StringUtils::Split(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    std::string token;
    std::istringstream token_stream(str);

    while (std::getline(token_stream, token, delimiter)) {
        if (!token.empty()) {  // Skip empty tokens
            tokens.push_back(token);
        }
    }

    return tokens;
}

std::vector<std::string> StringUtils::SplitLines(const std::string& str) {
    std::vector<std::string> lines;
    for (auto& line : Split(str, '\n')) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty()) {
            lines.push_back(line);
        }
    }
    return lines;
}

std::string StringUtils::Join(const std::vector<std::string>& strings,
                              const std::string& delimiter) {
    if (strings.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << strings[0];

    for (std::size_t i = 1; i < strings.size(); ++i) {
        oss << delimiter << strings[i];
    }

    return oss.str();
}

bool StringUtils::StartsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() &&
           str.compare(0, prefix.size(), prefix) == 0;
}

bool StringUtils::Contains(const std::string& str, const std::string& substring) {
    return str.find(substring) != std::string::npos;
}

std::string StringUtils::Truncate(const std::string& str,
                                  std::size_t max_length,
                                  const std::string& suffix) {
    if (str.length() <= max_length) {
        return str;
    }
    if (max_length <= suffix.length()) {
        return str.substr(0, max_length);
    }
    return str.substr(0, max_length - suffix.length()) + suffix;
}

std::string StringUtils::Tail(const std::string& str, std::size_t max_length) {
    if (str.size() <= max_length) {
        return str;
    }
    return "..." + str.substr(str.size() - max_length);
}

// ============================================================================
// VALIDATION
// ============================================================================

bool StringUtils::IsValidSandboxName(const std::string& name) {
    if (name.empty() || name.size() > 64) {
        return false;
    }
    if (name.front() == '.' || name.front() == '-') {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '.' || c == '-';
    });
}

bool StringUtils::IsValidPackageSpec(const std::string& spec) {
    if (spec.empty() || spec.front() == '-' || spec.size() > 256) {
        return false;
    }
    return std::none_of(spec.begin(), spec.end(), [](unsigned char c) {
        return std::isspace(c) || std::iscntrl(c) ||
               c == ';' || c == '&' || c == '|' || c == '`' || c == '$' ||
               c == '\'' || c == '"' || c == '\\';
    });
}

std::string StringUtils::NormalizePackageName(const std::string& spec) {
    auto cut = spec.find_first_of("<>=!~[;@ ");
    std::string name = ToLower(Trim(spec.substr(0, cut)));
    std::replace(name.begin(), name.end(), '_', '-');
    std::replace(name.begin(), name.end(), '.', '-');
    return name;
}

// ============================================================================
// SANDBOX PATHS
// ============================================================================

std::optional<std::string> StringUtils::ResolveInside(const std::string& base,
                                                      const std::string& path) {
    if (base.empty() || base.front() != '/') {
        return std::nullopt;
    }
    if (path.find('\0') != std::string::npos) {
        return std::nullopt;
    }

    auto base_parts = FoldComponents(base);
    if (!base_parts) {
        return std::nullopt;
    }

    std::string joined = (!path.empty() && path.front() == '/') ? path : base + "/" + path;
    auto parts = FoldComponents(joined);
    if (!parts || parts->size() < base_parts->size()) {
        return std::nullopt;
    }

    // Component-wise prefix check so "/app/results2" is not inside "/app/results"
    if (!std::equal(base_parts->begin(), base_parts->end(), parts->begin())) {
        return std::nullopt;
    }

    return ToAbsolute(*parts);
}

std::string StringUtils::ParentPath(const std::string& path) {
    auto pos = path.find_last_of('/');
    if (pos == std::string::npos || pos == 0) {
        return "/";
    }
    return path.substr(0, pos);
}

} // namespace utils
} // namespace sandcastle
