/**
 * @file Config.hpp
 * @brief Configuration management singleton.
 *
 * This file defines the Config class which provides a thread-safe singleton
 * for accessing and modifying application settings. It delegates parsing
 * to ConfigParsers and file I/O to ConfigLoader.
 *
 * @section Dependencies
 * - ConfigData
 * - ConfigLoader
 * - ConfigParsers
 *
 * @section Patterns
 * - Singleton: Global access point for configuration.
 * - Thread-Safe: Mutex-protected access to settings.
 */

#pragma once
#include <memory>
#include <mutex>
#include "ConfigData.hpp"
#include "util/Result.hpp"

namespace mc {

class Config {
public:
    static Config& instance();

    Result<void> load(const fs::path& path);
    Result<void> save(const fs::path& path) const;
    Result<void> loadDefault();

    // Restores built-in defaults (used by tests and before a reload)
    void reset();

    fs::path configPath() const {
        return configPath_;
    }
    bool debug() const {
        return debug_;
    }
    void setDebug(bool v) {
        debug_ = v;
        markDirty();
    }

    // Section accessors (const)
    const EncoderConfig& encoder() const {
        return encoder_;
    }
    const RecordingConfig& recording() const {
        return recording_;
    }
    const PlaybackConfig& playback() const {
        return playback_;
    }
    const NamingConfig& naming() const {
        return naming_;
    }

    // Section accessors (mutable)
    EncoderConfig& encoder() {
        markDirty();
        return encoder_;
    }
    RecordingConfig& recording() {
        markDirty();
        return recording_;
    }
    PlaybackConfig& playback() {
        markDirty();
        return playback_;
    }
    NamingConfig& naming() {
        markDirty();
        return naming_;
    }

    bool isDirty() const {
        return dirty_;
    }
    void markClean() {
        dirty_ = false;
    }

private:
    friend class ConfigLoader;

    Config() = default;
    void markDirty() {
        dirty_ = true;
    }

    fs::path configPath_;
    bool dirty_{false};
    bool debug_{false};

    EncoderConfig encoder_;
    RecordingConfig recording_;
    PlaybackConfig playback_;
    NamingConfig naming_;

    mutable std::mutex mutex_;
};

#define CONFIG mc::Config::instance()

} // namespace mc
