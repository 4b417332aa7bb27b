/**
 * @file EncoderSettings.hpp
 * @brief Where to look for the encoder binary and how long to wait on probes.
 */

#pragma once
#include <filesystem>
#include <vector>
#include "util/Types.hpp"

namespace mc {

namespace fs = std::filesystem;

struct EncoderSettings {
    static constexpr const char* kOverrideEnv = "MEETCAP_FFMPEG_PATH";

    fs::path overridePath;
    fs::path bundledDir;
    std::vector<fs::path> searchLocations;
    Duration probeTimeout{5000};

    // Platform install locations probed after the bundled binary
    static std::vector<fs::path> defaultSearchLocations();
    static const char* binaryName();

    static EncoderSettings fromConfig();
};

} // namespace mc
