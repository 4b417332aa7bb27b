/**
 * @file RecordingNames.hpp
 * @brief Human-readable recording filenames derived from meeting metadata.
 *
 * Names look like "Acme - Jane - Weekly sync - 2024-03-05 (1a2b3c4d).mp4":
 * an optional attendee prefix, the sanitized title, the local meeting date
 * and the short meeting id that RecordingLocator later uses to find the
 * file again.
 */

#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "util/Result.hpp"

namespace mc {

struct NamingOptions {
    std::string ownDomain; // attendees on this domain are skipped
    u32 maxTitleLength{60};

    static NamingOptions fromConfig();
};

class RecordingNames {
public:
    static std::string buildRecordingFilename(
            const std::string& meetingId,
            const std::string& title,
            const std::string& date,
            const std::vector<std::string>& attendees,
            const NamingOptions& options,
            std::string_view extension = ".mp4");

    // "<prefix - ><title> - <YYYY-MM-DD>" without id or extension
    static std::string sanitize(const std::string& title,
                                const std::string& date,
                                const std::vector<std::string>& attendees,
                                const NamingOptions& options);

    static std::string attendeePrefix(const std::vector<std::string>& attendees,
                                      const NamingOptions& options);
    static std::optional<std::string> companyFromEmail(const std::string& email);
    static std::optional<std::string> personName(const std::string& attendee);
    static std::string formatDate(const std::string& date);

    // Keeps the old extension; returns the new filename
    static Result<std::string> renameRecording(
            const std::filesystem::path& directory,
            const std::string& oldFilename,
            const std::string& meetingId,
            const std::string& newTitle,
            const std::string& date,
            const std::vector<std::string>& attendees,
            const NamingOptions& options);

    static Result<void> deleteRecording(const std::filesystem::path& directory,
                                        const std::string& filename);
};

} // namespace mc
