#pragma once

#include <string>
#include <string_view>

namespace bk::sync {

// Every '\' becomes '/'.
std::string normalizeSeparators(std::string_view path);

// Strips all leading and trailing '/'.
std::string trimSlashes(std::string_view prefix);

// "backup/" + "sub\\b.jpg" -> "backup/sub/b.jpg". An empty (or all-slash) prefix leaves the path as is.
// With a prefix, leading separators on the path are dropped so the join has a single '/'.
std::string mapKey(std::string_view relativePath, std::string_view prefix);

}
