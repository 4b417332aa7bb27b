#include "RecordingNames.hpp"
#include <QDate>
#include <QDateTime>
#include <QString>
#include <cctype>
#include <regex>
#include <set>
#include "RecordingLocator.hpp"
#include "core/Config.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "util/FileUtils.hpp"

namespace mc {

namespace fs = std::filesystem;

namespace {

const std::set<std::string>& webmailProviders() {
    static const std::set<std::string> providers{
            "gmail", "yahoo", "hotmail", "outlook", "icloud", "aol",
            "protonmail", "me", "live", "msn", "zoho", "fastmail",
            "hey", "tutanota", "gmx", "pm", "ymail", "mail"};
    return providers;
}

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos)
        return {};
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

std::string titleCase(std::string s) {
    bool startOfWord = true;
    for (char& c : s) {
        auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc)) {
            if (startOfWord)
                c = static_cast<char>(std::toupper(uc));
            startOfWord = false;
        } else {
            startOfWord = true;
        }
    }
    return s;
}

} // namespace

NamingOptions NamingOptions::fromConfig() {
    const Config& config = CONFIG;
    return NamingOptions{config.naming().ownDomain,
                         config.naming().maxTitleLength};
}

std::optional<std::string> RecordingNames::companyFromEmail(
        const std::string& email) {
    static const std::regex domainLabel(R"(@([^.]+)\.)");
    std::smatch match;
    if (!std::regex_search(email, match, domainLabel))
        return std::nullopt;

    auto domain = file::toLower(match[1].str());
    if (webmailProviders().contains(domain))
        return std::nullopt;

    for (char& c : domain) {
        if (c == '-' || c == '_')
            c = ' ';
    }
    return titleCase(domain);
}

std::optional<std::string> RecordingNames::personName(
        const std::string& attendee) {
    if (auto at = attendee.find('@'); at != std::string::npos) {
        auto local = attendee.substr(0, at);
        auto first = local.substr(0, local.find_first_of("._"));
        if (first.empty())
            return std::nullopt;
        first = file::toLower(first);
        first[0] = static_cast<char>(
                std::toupper(static_cast<unsigned char>(first[0])));
        return first;
    }

    auto trimmed = trim(attendee);
    auto first = trimmed.substr(0, trimmed.find_first_of(" \t"));
    if (first.empty())
        return std::nullopt;
    return first;
}

std::string RecordingNames::attendeePrefix(
        const std::vector<std::string>& attendees,
        const NamingOptions& options) {
    std::optional<std::string> company;
    std::optional<std::string> person;

    for (const auto& attendee : attendees) {
        if (!options.ownDomain.empty() &&
            file::toLower(attendee).find(options.ownDomain) != std::string::npos)
            continue;

        if (!company && attendee.find('@') != std::string::npos)
            company = companyFromEmail(attendee);
        if (!person)
            person = personName(attendee);
        if (company && person)
            break;
    }

    if (company && person)
        return *company + " - " + *person;
    if (company)
        return *company;
    if (person)
        return *person;
    return {};
}

std::string RecordingNames::formatDate(const std::string& date) {
    auto qdate = QString::fromStdString(date).trimmed();
    auto dt = QDateTime::fromString(qdate, Qt::ISODateWithMs);
    if (!dt.isValid())
        dt = QDateTime::fromString(qdate, Qt::ISODate);
    if (dt.isValid()) {
        // Timestamps carry a zone; the file shows the local calendar day
        if (dt.timeSpec() != Qt::LocalTime)
            dt = dt.toLocalTime();
        return dt.date().toString(Qt::ISODate).toStdString();
    }

    auto d = QDate::fromString(qdate.left(10), Qt::ISODate);
    if (d.isValid())
        return d.toString(Qt::ISODate).toStdString();

    LOG_DEBUG("Unrecognised meeting date '{}'", date);
    return {};
}

std::string RecordingNames::sanitize(const std::string& title,
                                     const std::string& date,
                                     const std::vector<std::string>& attendees,
                                     const NamingOptions& options) {
    static const std::regex unsafe(R"([/\\:*?"<>|])");
    static const std::regex runs(R"([-\s]+)");

    auto safe = std::regex_replace(title, unsafe, "-");
    safe = trim(std::regex_replace(safe, runs, " "));
    if (safe.size() > options.maxTitleLength)
        safe = trim(safe.substr(0, options.maxTitleLength));

    auto day = formatDate(date);
    auto prefix = attendeePrefix(attendees, options);

    std::string out;
    if (!prefix.empty())
        out = prefix + " - ";
    if (!safe.empty())
        out += safe;
    if (!day.empty())
        out += (out.empty() ? "" : " - ") + day;
    return out;
}

std::string RecordingNames::buildRecordingFilename(
        const std::string& meetingId,
        const std::string& title,
        const std::string& date,
        const std::vector<std::string>& attendees,
        const NamingOptions& options,
        std::string_view extension) {
    if (title.empty() || date.empty())
        return meetingId + std::string(extension);

    auto name = sanitize(title, date, attendees, options);
    if (name.empty())
        return meetingId + std::string(extension);
    return name + " (" + RecordingLocator::shortId(meetingId) + ")" +
           std::string(extension);
}

Result<std::string> RecordingNames::renameRecording(
        const fs::path& directory,
        const std::string& oldFilename,
        const std::string& meetingId,
        const std::string& newTitle,
        const std::string& date,
        const std::vector<std::string>& attendees,
        const NamingOptions& options) {
    auto ext = fs::path(oldFilename).extension().string();
    if (ext.empty())
        ext = ".mp4";

    auto newFilename = buildRecordingFilename(
            meetingId, newTitle, date, attendees, options, ext);
    auto oldPath = directory / oldFilename;
    auto newPath = directory / newFilename;

    std::error_code ec;
    if (oldPath != newPath && fs::exists(oldPath, ec)) {
        fs::rename(oldPath, newPath, ec);
        if (ec) {
            return Result<std::string>::err(
                    RecorderError::FilesystemError,
                    "Failed to rename " + oldFilename + ": " + ec.message());
        }
        LOG_INFO("Renamed recording '{}' -> '{}'", oldFilename, newFilename);
    }
    return Result<std::string>::ok(newFilename);
}

Result<void> RecordingNames::deleteRecording(const fs::path& directory,
                                             const std::string& filename) {
    std::error_code ec;
    if (file::removeIfExists(directory / filename, ec)) {
        LOG_INFO("Deleted recording '{}'", filename);
    } else if (ec) {
        return Result<void>::err(RecorderError::FilesystemError,
                                 "Failed to delete " + filename + ": " +
                                         ec.message());
    }
    return Result<void>::ok();
}

} // namespace mc
