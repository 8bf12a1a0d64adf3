#pragma once

#include <filesystem>
#include <string>

namespace bk::sync::model {

struct FileEntry {
    std::string relativePath;               // '/' separated, relative to the sync root
    std::filesystem::path absolutePath;
};

}
