/**
 * @file RecorderSettings.hpp
 * @brief Recording directory, temp naming and pipeline limits.
 */

#pragma once
#include <filesystem>
#include <string>
#include <string_view>
#include "util/Types.hpp"

namespace mc {

namespace fs = std::filesystem;

struct RecorderSettings {
    // Reserved suffix of in-progress output; never used for final names
    static constexpr std::string_view kTempSuffix = ".mp4.tmp";

    fs::path directory;
    Duration finalizeTimeout{20000};
    u64 writeHighWater{1024 * 1024};
    usize stderrTailLines{20};
    Duration discardWait{2000};
    Duration spawnTimeout{5000};

    // Generation 0 is "<id>.mp4.tmp"; later ones are "<id>.<n>.mp4.tmp"
    fs::path tempPathFor(const std::string& meetingId, u32 generation = 0) const {
        auto stem = generation == 0 ? meetingId
                                    : meetingId + "." + std::to_string(generation);
        return directory / (stem + std::string(kTempSuffix));
    }

    static fs::path defaultDirectory();
    static RecorderSettings fromConfig();
};

} // namespace mc
