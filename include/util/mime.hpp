#pragma once

#include <string>
#include <string_view>

namespace bk::util {

constexpr static auto DEFAULT_MIME_TYPE = "application/octet-stream";

// Extension lookup, case-insensitive. Unknown or missing extension -> DEFAULT_MIME_TYPE.
std::string mimeTypeFor(std::string_view filename);

}
