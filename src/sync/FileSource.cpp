#include "sync/FileSource.hpp"
#include "sync/errors.hpp"
#include "util/files.hpp"

using namespace bk::sync;

std::string LocalFileSource::read(const std::filesystem::path& absPath) const {
    try {
        return util::readFileToString(absPath);
    } catch (const std::exception& e) {
        throw FileReadError(e.what());
    }
}
