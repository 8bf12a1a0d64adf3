#include "sync/KeyMapper.hpp"

#include <algorithm>

namespace bk::sync {

std::string normalizeSeparators(const std::string_view path) {
    std::string out(path);
    std::replace(out.begin(), out.end(), '\\', '/');
    return out;
}

std::string trimSlashes(std::string_view prefix) {
    while (!prefix.empty() && prefix.front() == '/') prefix.remove_prefix(1);
    while (!prefix.empty() && prefix.back() == '/') prefix.remove_suffix(1);
    return std::string(prefix);
}

std::string mapKey(const std::string_view relativePath, const std::string_view prefix) {
    auto normalized = normalizeSeparators(relativePath);
    if (prefix.empty()) return normalized;

    const auto trimmed = trimSlashes(prefix);
    if (trimmed.empty()) return normalized;

    // exactly one '/' at the join
    const auto first = normalized.find_first_not_of('/');
    return trimmed + "/" + (first == std::string::npos ? std::string() : normalized.substr(first));
}

}
