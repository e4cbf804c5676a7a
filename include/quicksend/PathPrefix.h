/**
 * @file PathPrefix.h
 * @brief Common path prefix computation and stripping
 *
 * Paths are treated as opaque strings: no normalization, no resolution.
 * Both '/' and '\\' count as component separators.
 *
 * (c) 2026 QuickSend Project
 * Licensed under MIT License
 */

#pragma once

#include <string>
#include <vector>

namespace QuickSend {

inline bool isPathSeparator(char c) {
    return c == '/' || c == '\\';
}

/**
 * @brief Longest whole-component prefix shared by every path
 * @param paths Entry paths in session order
 * @return Prefix ending with a separator, or empty
 *
 * Empty for fewer than two paths. The character-wise common prefix is cut
 * back to (and including) its last separator, so "/home/al/x" and
 * "/home/alice/y" give "/home/".
 */
std::string commonPathPrefix(const std::vector<std::string>& paths);

/**
 * @brief Remove prefix from path
 * @param path Entry path
 * @param prefix Prefix produced by commonPathPrefix()
 * @param stripped Output: remainder of path
 * @return false if prefix is not a whole-component prefix of path
 *
 * An empty prefix always succeeds and leaves the path unchanged.
 */
bool stripPathPrefix(const std::string& path, const std::string& prefix,
                     std::string& stripped);

}  // namespace QuickSend
