#pragma once

#include <optional>
#include <string>
#include <vector>

namespace bk::cli {

struct FlagKV {
    std::string key;
    std::optional<std::string> value;
};

struct CommandCall {
    std::vector<FlagKV> options;
    std::vector<std::string> positionals;
};

inline const FlagKV* findOpt(const CommandCall& c, const std::string& key) {
    for (const auto& kv : c.options) if (kv.key == key) return &kv;
    return nullptr;
}

inline bool hasFlag(const CommandCall& c, const std::string& key) {
    return findOpt(c, key) != nullptr;
}

}
