#include "OrphanSweep.hpp"
#include "RecorderSettings.hpp"
#include "core/Logger.hpp"
#include "util/FileUtils.hpp"

namespace mc {

const std::vector<std::string>& OrphanSweep::tempSuffixes() {
    // .webm.tmp was written by builds that stored the raw capture stream
    static const std::vector<std::string> suffixes{
            std::string(RecorderSettings::kTempSuffix), ".webm.tmp"};
    return suffixes;
}

bool OrphanSweep::isTempName(std::string_view filename) {
    for (const auto& suffix : tempSuffixes()) {
        if (filename.size() > suffix.size() && file::endsWith(filename, suffix))
            return true;
    }
    return false;
}

SweepReport OrphanSweep::run(const std::filesystem::path& directory) {
    SweepReport report;
    std::error_code ec;
    if (!std::filesystem::is_directory(directory, ec))
        return report;

    for (const auto& path : file::listFiles(directory, {})) {
        auto name = path.filename().string();
        if (!isTempName(name))
            continue;

        if (file::removeIfExists(path, ec)) {
            ++report.removed;
            LOG_INFO("Cleaned up orphaned temp file: {}", name);
        } else if (ec) {
            ++report.failed;
            LOG_WARN("Failed to remove orphaned temp file {}: {}",
                     name,
                     ec.message());
        }
    }
    return report;
}

} // namespace mc
