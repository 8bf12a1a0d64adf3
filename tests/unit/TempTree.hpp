#pragma once

#include <filesystem>
#include <fstream>
#include <random>
#include <string>

namespace bk::test {

// Scratch directory removed on destruction.
class TempTree {
public:
    TempTree() {
        std::random_device rd;
        root_ = std::filesystem::temp_directory_path() / ("bucketeer_test_" + std::to_string(rd()) + std::to_string(rd()));
        std::filesystem::create_directories(root_);
    }

    ~TempTree() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    TempTree(const TempTree&) = delete;
    TempTree& operator=(const TempTree&) = delete;

    std::filesystem::path write(const std::string& rel, const std::string& content) const {
        const auto p = root_ / rel;
        std::filesystem::create_directories(p.parent_path());
        std::ofstream out(p, std::ios::binary);
        out << content;
        return p;
    }

    [[nodiscard]] const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

}
