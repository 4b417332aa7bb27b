#include "ConfigParsers.hpp"
#include <algorithm>
#include "Logger.hpp"
#include "util/FileUtils.hpp"

namespace mc {

namespace {
template <typename T>
T get(const toml::table& tbl, std::string_view key, T defaultVal) {
    if (auto node = tbl[key]) {
        if constexpr (std::is_same_v<T, std::string>) {
            if (auto val = node.value<std::string>())
                return *val;
        } else if constexpr (std::is_same_v<T, bool>) {
            if (auto val = node.value<bool>())
                return *val;
        } else if constexpr (std::is_integral_v<T>) {
            if (auto val = node.value<i64>()) {
                if (*val < 0) {
                    LOG_WARN("Config: negative value for '{}' ignored", key);
                    return defaultVal;
                }
                return static_cast<T>(*val);
            }
        }
    }
    return defaultVal;
}

fs::path optionalPath(const toml::table& tbl, std::string_view key) {
    auto str = get(tbl, key, std::string());
    return str.empty() ? fs::path() : file::expandHome(str);
}
} // namespace

void ConfigParsers::parseEncoder(const toml::table& tbl, EncoderConfig& cfg) {
    if (auto enc = tbl["encoder"].as_table()) {
        cfg.path = optionalPath(*enc, "path");
        cfg.bundledDir = optionalPath(*enc, "bundled_dir");
        cfg.probeTimeoutMs =
                std::clamp(get(*enc, "probe_timeout_ms", 5000u), 500u, 60000u);

        if (auto paths = (*enc)["search_paths"].as_array()) {
            cfg.searchPaths.clear();
            for (const auto& p : *paths) {
                if (auto s = p.value<std::string>())
                    cfg.searchPaths.push_back(file::expandHome(*s));
            }
        }
    }
}

void ConfigParsers::parseRecording(const toml::table& tbl,
                                   RecordingConfig& cfg) {
    if (auto rec = tbl["recording"].as_table()) {
        cfg.directory = optionalPath(*rec, "directory");
        cfg.finalizeTimeoutMs = std::clamp(
                get(*rec, "finalize_timeout_ms", 20000u), 1000u, 600000u);
        cfg.writeHighWaterBytes =
                std::clamp<u64>(get<u64>(*rec, "write_high_water_bytes", 1 << 20),
                                64 * 1024,
                                64ull * 1024 * 1024);
        cfg.stderrTailLines =
                std::clamp(get(*rec, "stderr_tail_lines", 20u), 1u, 200u);
        cfg.chunkSize = std::clamp(
                get(*rec, "chunk_size", 65536u), 4096u, 16u * 1024 * 1024);
    }
}

void ConfigParsers::parsePlayback(const toml::table& tbl, PlaybackConfig& cfg) {
    if (auto pb = tbl["playback"].as_table()) {
        cfg.transcodeTimeoutMs = std::clamp(
                get(*pb, "transcode_timeout_ms", 600000u), 10000u, 3600000u);
    }
}

void ConfigParsers::parseNaming(const toml::table& tbl, NamingConfig& cfg) {
    if (auto naming = tbl["naming"].as_table()) {
        cfg.ownDomain = file::toLower(get(*naming, "own_domain", std::string()));
        cfg.maxTitleLength =
                std::clamp(get(*naming, "max_title_length", 60u), 8u, 200u);
    }
}

toml::table ConfigParsers::serialize(const EncoderConfig& encoder,
                                     const RecordingConfig& recording,
                                     const PlaybackConfig& playback,
                                     const NamingConfig& naming,
                                     bool debug) {
    toml::table root;
    root.insert("general", toml::table{{"debug", debug}});

    toml::array searchArr;
    for (const auto& p : encoder.searchPaths)
        searchArr.push_back(p.string());
    root.insert("encoder",
                toml::table{{"path", encoder.path.string()},
                            {"bundled_dir", encoder.bundledDir.string()},
                            {"search_paths", searchArr},
                            {"probe_timeout_ms", (i64)encoder.probeTimeoutMs}});

    root.insert(
            "recording",
            toml::table{
                    {"directory", recording.directory.string()},
                    {"finalize_timeout_ms", (i64)recording.finalizeTimeoutMs},
                    {"write_high_water_bytes",
                     (i64)recording.writeHighWaterBytes},
                    {"stderr_tail_lines", (i64)recording.stderrTailLines},
                    {"chunk_size", (i64)recording.chunkSize}});

    root.insert("playback",
                toml::table{{"transcode_timeout_ms",
                             (i64)playback.transcodeTimeoutMs}});

    root.insert("naming",
                toml::table{{"own_domain", naming.ownDomain},
                            {"max_title_length", (i64)naming.maxTitleLength}});

    return root;
}

} // namespace mc
