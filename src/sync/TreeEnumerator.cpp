#include "sync/TreeEnumerator.hpp"
#include "sync/errors.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <system_error>

using namespace bk::sync;
using namespace bk::sync::model;
using namespace bk::logging;
namespace fs = std::filesystem;

bool TreeEnumerator::isHidden(const fs::path& name) {
    const auto s = name.filename().string();
    return !s.empty() && s.front() == '.';
}

std::vector<FileEntry> TreeEnumerator::enumerate(const fs::path& root) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) throw DirectoryNotFound(root);

    std::vector<FileEntry> out;

    fs::recursive_directory_iterator it(root, fs::directory_options::none, ec);
    if (ec) throw DirectoryNotFound(root, "cannot open directory (" + ec.message() + ")");

    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) throw DirectoryNotFound(root, "cannot traverse directory (" + ec.message() + ")");

        const auto& entry = *it;
        std::error_code statEc;

        if (isHidden(entry.path())) {
            if (entry.is_directory(statEc) && !entry.is_symlink(statEc)) it.disable_recursion_pending();
            continue;
        }

        if (entry.is_symlink(statEc)) {
            LogRegistry::fs()->debug("[TreeEnumerator] Skipping symlink: {}", entry.path().string());
            continue;
        }

        if (!entry.is_regular_file(statEc)) continue;

        FileEntry fe;
        fe.absolutePath = entry.path();
        fe.relativePath = entry.path().lexically_relative(root).generic_string();
        out.push_back(std::move(fe));
    }

    if (ec) throw DirectoryNotFound(root, "cannot traverse directory (" + ec.message() + ")");

    std::sort(out.begin(), out.end(),
              [](const FileEntry& a, const FileEntry& b) { return a.relativePath < b.relativePath; });

    LogRegistry::fs()->debug("[TreeEnumerator] Found {} files under {}", out.size(), root.string());
    return out;
}
