#include "RecordingLocator.hpp"
#include "core/Logger.hpp"
#include "recorder/OrphanSweep.hpp"
#include "util/FileUtils.hpp"

namespace mc {

namespace fs = std::filesystem;

namespace {
bool isFile(const fs::path& p) {
    std::error_code ec;
    return fs::is_regular_file(p, ec);
}

bool isPlainName(const std::string& name) {
    return !name.empty() && fs::path(name).filename().string() == name;
}
} // namespace

const std::vector<std::string>& RecordingLocator::videoExtensions() {
    static const std::vector<std::string> exts{
            ".mp4", ".webm", ".mkv", ".mov", ".m4v"};
    return exts;
}

std::string RecordingLocator::shortId(const std::string& meetingId) {
    return meetingId.substr(0, meetingId.find('-'));
}

std::string RecordingLocator::baseName(const std::string& filename) {
    auto stem = fs::path(filename).stem().string();
    if (file::endsWith(stem, kPlaybackMarker))
        stem.resize(stem.size() - std::string_view(kPlaybackMarker).size());
    return stem;
}

std::vector<std::string> RecordingLocator::variants(
        const std::string& storedFilename) {
    auto base = baseName(storedFilename);
    if (base.empty())
        return {};
    return {base + ".mp4",
            base + ".webm",
            base + std::string(kPlaybackMarker) + ".mp4"};
}

i32 RecordingLocator::matchScore(const std::string& filename,
                                 const std::string& meetingId) {
    if (meetingId.empty())
        return 0;
    if (filename.find(meetingId) != std::string::npos)
        return 3;
    auto sid = shortId(meetingId);
    if (sid.empty())
        return 0;
    if (filename.find("(" + sid + ")") != std::string::npos)
        return 2;
    if (filename.find(sid) != std::string::npos)
        return 1;
    return 0;
}

std::optional<std::string> RecordingLocator::resolve(
        const fs::path& directory,
        const std::string& meetingId,
        const std::string& storedFilename) {
    if (isPlainName(storedFilename)) {
        if (isFile(directory / storedFilename))
            return storedFilename;

        for (const auto& candidate : variants(storedFilename)) {
            if (candidate != storedFilename && isFile(directory / candidate)) {
                LOG_DEBUG("Recording '{}' found as '{}'", storedFilename, candidate);
                return candidate;
            }
        }
    }

    std::optional<std::string> best;
    i32 bestScore = 0;
    fs::file_time_type bestTime{};

    for (const auto& path : file::listFiles(directory, videoExtensions())) {
        auto name = path.filename().string();
        if (OrphanSweep::isTempName(name))
            continue;

        auto score = matchScore(name, meetingId);
        if (score == 0)
            continue;

        std::error_code ec;
        auto mtime = fs::last_write_time(path, ec);
        if (ec)
            mtime = fs::file_time_type{};

        if (score > bestScore || (score == bestScore && mtime > bestTime)) {
            best = name;
            bestScore = score;
            bestTime = mtime;
        }
    }

    if (best) {
        LOG_DEBUG("Recording for meeting {} resolved by scan to '{}' (score {})",
                  meetingId,
                  *best,
                  bestScore);
    }
    return best;
}

} // namespace mc
