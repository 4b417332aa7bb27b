#include "RecorderSettings.hpp"
#include "core/Config.hpp"
#include "util/FileUtils.hpp"

namespace mc {

fs::path RecorderSettings::defaultDirectory() {
    return file::dataDir() / "recordings";
}

RecorderSettings RecorderSettings::fromConfig() {
    const Config& config = CONFIG;
    const auto& rec = config.recording();

    RecorderSettings settings;
    settings.directory =
            rec.directory.empty() ? defaultDirectory() : rec.directory;
    settings.finalizeTimeout = Duration(rec.finalizeTimeoutMs);
    settings.writeHighWater = rec.writeHighWaterBytes;
    settings.stderrTailLines = rec.stderrTailLines;
    settings.spawnTimeout = Duration(config.encoder().probeTimeoutMs);
    return settings;
}

} // namespace mc
