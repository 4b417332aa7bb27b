/**
 * @file ConfigData.hpp
 * @brief Configuration data structures.
 *
 * This file defines the POD (Plain Old Data) structs used to hold configuration
 * values. It is separated from the logic classes to keep headers lean and
 * avoid circular dependencies.
 */

#pragma once
#include <filesystem>
#include <string>
#include <vector>
#include "util/Types.hpp"

namespace mc {

namespace fs = std::filesystem;

// External encoder lookup
struct EncoderConfig {
    fs::path path;       // explicit override, empty = auto
    fs::path bundledDir; // empty = application directory
    std::vector<fs::path> searchPaths; // empty = platform defaults
    u32 probeTimeoutMs{5000};
};

// Capture-to-file pipeline
struct RecordingConfig {
    fs::path directory;
    u32 finalizeTimeoutMs{20000};
    u64 writeHighWaterBytes{1024 * 1024};
    u32 stderrTailLines{20};
    u32 chunkSize{64 * 1024};
};

struct PlaybackConfig {
    u32 transcodeTimeoutMs{600000};
};

// Recording filename generation
struct NamingConfig {
    std::string ownDomain; // attendees on this domain are left out of names
    u32 maxTitleLength{60};
};

} // namespace mc
