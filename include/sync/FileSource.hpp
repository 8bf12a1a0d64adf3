#pragma once

#include <filesystem>
#include <string>

namespace bk::sync {

class FileSource {
public:
    virtual ~FileSource() = default;

    // Whole file contents. Throws FileReadError.
    [[nodiscard]] virtual std::string read(const std::filesystem::path& absPath) const = 0;
};

class LocalFileSource final : public FileSource {
public:
    [[nodiscard]] std::string read(const std::filesystem::path& absPath) const override;
};

}
