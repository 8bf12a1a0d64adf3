#include "cli/SyncCommand.hpp"
#include "cli/Parser.hpp"
#include "config/ConfigRegistry.hpp"
#include "sync/errors.hpp"

#include <charconv>
#include <fmt/format.h>

using namespace bk::cli;

namespace {
const std::unordered_set<std::string> kSwitches{"dry", "help", "h"};
const std::unordered_set<std::string> kValued{"dir", "prefix", "concurrency", "config"};

std::string requireValue(const FlagKV& kv) {
    if (!kv.value) throw UsageError(fmt::format("--{} requires a value", kv.key));
    return *kv.value;
}

int parseConcurrency(const std::string& s) {
    int v = 0;
    const auto* end = s.data() + s.size();
    const auto [ptr, ec] = std::from_chars(s.data(), end, v);
    if (ec != std::errc() || ptr != end)
        throw bk::sync::InvalidConfig(fmt::format("--concurrency must be an integer, got '{}'", s));
    if (v <= 0)
        throw bk::sync::InvalidConfig(fmt::format("--concurrency must be positive, got {}", v));
    return v;
}
}

std::string bk::cli::syncUsage(const std::string& program) {
    return fmt::format(
        "Usage: {} --dir <path> [--prefix <key/prefix/>] [--dry] [--concurrency <n>] [--config <file>]\n"
        "\n"
        "  --dir <path>          local directory to mirror (required)\n"
        "  --prefix <string>     key prefix inside the bucket (default: none)\n"
        "  --dry                 log what would be uploaded without uploading\n"
        "  --concurrency <n>     parallel uploads (default: 5)\n"
        "  --config <file>       YAML config (default: {})\n"
        "  -h, --help            show this message\n",
        program, config::DEFAULT_CONFIG_PATH);
}

SyncArgs bk::cli::parseSyncArgs(const CommandCall& call) {
    SyncArgs out;

    if (!call.positionals.empty())
        throw UsageError(fmt::format("Unexpected argument: {}", call.positionals.front()));

    out.help = hasFlag(call, "help") || hasFlag(call, "h");
    out.dry = hasFlag(call, "dry");

    for (const auto& kv : call.options) {
        if (kSwitches.contains(kv.key)) continue;

        if (!kValued.contains(kv.key)) throw UsageError(fmt::format("Unknown option: --{}", kv.key));

        const auto value = requireValue(kv);
        if (kv.key == "dir") out.dir = value;
        else if (kv.key == "prefix") out.prefix = value;
        else if (kv.key == "config") out.configPath = value;
        else if (kv.key == "concurrency") {
            out.concurrency = parseConcurrency(value);
            out.concurrencyGiven = true;
        }
    }

    if (out.help) return out;
    if (out.dir.empty()) throw UsageError("--dir is required");
    return out;
}

SyncArgs bk::cli::parseSyncArgs(const std::vector<std::string>& args) {
    return parseSyncArgs(parseTokens(tokenize(args), kSwitches));
}
