#include "ConfigLoader.hpp"
#include <QCoreApplication>
#include <fstream>
#include <vector>
#include "Config.hpp"
#include "ConfigParsers.hpp"
#include "Logger.hpp"
#include "util/FileUtils.hpp"

namespace mc {

namespace {

// Shipped default.toml locations, most specific first
std::vector<fs::path> systemDefaults() {
    std::vector<fs::path> candidates;
    if (QCoreApplication::instance()) {
        fs::path appDir = QCoreApplication::applicationDirPath().toStdString();
        candidates.push_back(appDir.parent_path() / "share/meetcap/config/default.toml");
    }
    candidates.emplace_back("/usr/local/share/meetcap/config/default.toml");
    candidates.emplace_back("/usr/share/meetcap/config/default.toml");
    return candidates;
}

} // namespace

Result<void> ConfigLoader::load(Config& config, const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec))
        return Result<void>::err("Config file not found: " + path.string());

    try {
        auto tbl = toml::parse_file(path.string());

        if (auto gen = tbl["general"].as_table()) {
            config.debug_ = (*gen)["debug"].value_or(false);
        }

        ConfigParsers::parseEncoder(tbl, config.encoder_);
        ConfigParsers::parseRecording(tbl, config.recording_);
        ConfigParsers::parsePlayback(tbl, config.playback_);
        ConfigParsers::parseNaming(tbl, config.naming_);

        config.markClean();
        LOG_INFO("Config loaded from: {}", path.string());
        return Result<void>::ok();
    } catch (const toml::parse_error& err) {
        const auto& where = err.source().begin;
        return Result<void>::err(path.string() + ":" + std::to_string(where.line) +
                                 ":" + std::to_string(where.column) + ": " +
                                 std::string(err.description()));
    }
}

Result<void> ConfigLoader::loadDefault(Config& config) {
    auto configDir = file::configDir();
    auto userPath = configDir / "config.toml";
    config.configPath_ = userPath;

    std::error_code ec;
    if (fs::exists(userPath, ec))
        return load(config, userPath);

    file::ensureDir(configDir);
    for (const auto& shipped : systemDefaults()) {
        if (!fs::exists(shipped, ec))
            continue;
        fs::copy_file(shipped, userPath, ec);
        if (!ec) {
            LOG_INFO("Installed default config from {}", shipped.string());
            return load(config, userPath);
        }
        LOG_WARN("Cannot copy {}: {}", shipped.string(), ec.message());
    }

    LOG_WARN("No config file found, writing built-in defaults to {}",
             userPath.string());
    if (auto saved = save(config, userPath); !saved) {
        LOG_WARN("{}", saved.error().message);
    }
    return Result<void>::ok();
}

Result<void> ConfigLoader::save(const Config& config, const fs::path& path) {
    auto tbl = ConfigParsers::serialize(config.encoder_,
                                        config.recording_,
                                        config.playback_,
                                        config.naming_,
                                        config.debug_);
    fs::path tempPath = path;
    tempPath += ".tmp";
    {
        std::ofstream file(tempPath);
        if (!file)
            return Result<void>::err("Failed to open " + tempPath.string());
        file << tbl;
        if (!file.flush())
            return Result<void>::err("Failed to write " + tempPath.string());
    }

    std::error_code ec;
    fs::rename(tempPath, path, ec);
    if (ec) {
        auto reason = ec.message();
        file::removeIfExists(tempPath, ec);
        return Result<void>::err("Failed to save config to " + path.string() +
                                 ": " + reason);
    }
    LOG_DEBUG("Config saved to: {}", path.string());
    return Result<void>::ok();
}

} // namespace mc
