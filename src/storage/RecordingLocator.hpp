/**
 * @file RecordingLocator.hpp
 * @brief Finds the file on disk that belongs to a meeting's recording.
 *
 * The stored filename can go stale: playback conversion adds a second file
 * with a different suffix, older builds wrote other containers, and renames
 * change the title part. Lookup goes from exact to fuzzy: the stored name,
 * then known extension variants of its base name, then a scan of the
 * recordings directory scored by how specifically a name encodes the meeting.
 */

#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "util/Types.hpp"

namespace mc {

class RecordingLocator {
public:
    static constexpr const char* kPlaybackMarker = ".playback";

    static std::optional<std::string> resolve(
            const std::filesystem::path& directory,
            const std::string& meetingId,
            const std::string& storedFilename);

    // Base name with the container extension and playback marker removed
    static std::string baseName(const std::string& filename);
    static std::vector<std::string> variants(const std::string& storedFilename);

    // 3 = full id, 2 = "(shortId)", 1 = bare shortId, 0 = no match
    static i32 matchScore(const std::string& filename, const std::string& meetingId);
    static std::string shortId(const std::string& meetingId);

    static const std::vector<std::string>& videoExtensions();
};

} // namespace mc
