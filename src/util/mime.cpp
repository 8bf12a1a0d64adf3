#include "util/mime.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace bk::util {

namespace {
const std::unordered_map<std::string, std::string>& mimeTable() {
    static const std::unordered_map<std::string, std::string> table{
        // text
        {"txt", "text/plain"}, {"log", "text/plain"}, {"md", "text/markdown"},
        {"csv", "text/csv"}, {"tsv", "text/tab-separated-values"},
        {"html", "text/html"}, {"htm", "text/html"}, {"css", "text/css"},
        {"xml", "application/xml"}, {"yaml", "application/yaml"}, {"yml", "application/yaml"},

        // web
        {"js", "application/javascript"}, {"mjs", "application/javascript"},
        {"json", "application/json"}, {"map", "application/json"}, {"wasm", "application/wasm"},

        // images
        {"jpg", "image/jpeg"}, {"jpeg", "image/jpeg"}, {"png", "image/png"}, {"gif", "image/gif"},
        {"webp", "image/webp"}, {"svg", "image/svg+xml"}, {"ico", "image/x-icon"},
        {"bmp", "image/bmp"}, {"tif", "image/tiff"}, {"tiff", "image/tiff"}, {"avif", "image/avif"},

        // audio / video
        {"mp3", "audio/mpeg"}, {"wav", "audio/wav"}, {"ogg", "audio/ogg"}, {"flac", "audio/flac"},
        {"m4a", "audio/mp4"}, {"mp4", "video/mp4"}, {"webm", "video/webm"}, {"mov", "video/quicktime"},
        {"mkv", "video/x-matroska"}, {"avi", "video/x-msvideo"},

        // fonts
        {"woff", "font/woff"}, {"woff2", "font/woff2"}, {"ttf", "font/ttf"}, {"otf", "font/otf"},

        // documents
        {"pdf", "application/pdf"}, {"doc", "application/msword"},
        {"docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
        {"xls", "application/vnd.ms-excel"},
        {"xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
        {"ppt", "application/vnd.ms-powerpoint"},
        {"pptx", "application/vnd.openxmlformats-officedocument.presentationml.presentation"},

        // archives
        {"zip", "application/zip"}, {"gz", "application/gzip"}, {"tar", "application/x-tar"},
        {"bz2", "application/x-bzip2"}, {"xz", "application/x-xz"}, {"7z", "application/x-7z-compressed"},
    };
    return table;
}
}

std::string mimeTypeFor(const std::string_view filename) {
    const auto slash = filename.find_last_of("/\\");
    const auto base = slash == std::string_view::npos ? filename : filename.substr(slash + 1);

    const auto dot = base.rfind('.');
    if (dot == std::string_view::npos || dot + 1 == base.size()) return DEFAULT_MIME_TYPE;

    std::string ext(base.substr(dot + 1));
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });

    const auto& table = mimeTable();
    if (const auto it = table.find(ext); it != table.end()) return it->second;
    return DEFAULT_MIME_TYPE;
}

}
