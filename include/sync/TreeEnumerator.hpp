#pragma once

#include "sync/model/FileEntry.hpp"

#include <filesystem>
#include <vector>

namespace bk::sync {

class TreeEnumerator {
public:
    // Regular files under root, sorted by relative path. Anything below a dot-prefixed
    // component is skipped, as are symlinks. Throws DirectoryNotFound.
    static std::vector<model::FileEntry> enumerate(const std::filesystem::path& root);

    static bool isHidden(const std::filesystem::path& name);
};

}
