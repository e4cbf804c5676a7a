/**
 * @file PathPrefix.cpp
 * @brief Common path prefix computation and stripping
 *
 * (c) 2026 QuickSend Project
 * Licensed under MIT License
 */

#include "quicksend/PathPrefix.h"

namespace QuickSend {

std::string commonPathPrefix(const std::vector<std::string>& paths) {
    if (paths.size() < 2) {
        return {};
    }

    size_t common = paths.front().size();
    for (size_t i = 1; i < paths.size() && common > 0; ++i) {
        const std::string& p = paths[i];
        size_t limit = (p.size() < common) ? p.size() : common;
        size_t j = 0;
        while (j < limit && p[j] == paths.front()[j]) {
            ++j;
        }
        common = j;
    }

    // Cut back so the prefix never ends inside a component
    while (common > 0 && !isPathSeparator(paths.front()[common - 1])) {
        --common;
    }

    return paths.front().substr(0, common);
}

bool stripPathPrefix(const std::string& path, const std::string& prefix,
                     std::string& stripped)
{
    if (prefix.empty()) {
        stripped = path;
        return true;
    }
    if (!isPathSeparator(prefix.back())) {
        return false;
    }
    if (path.size() < prefix.size() || path.compare(0, prefix.size(), prefix) != 0) {
        return false;
    }

    stripped = path.substr(prefix.size());
    return true;
}

}  // namespace QuickSend
