#include "EncoderSettings.hpp"
#include <QCoreApplication>
#include "core/Config.hpp"

namespace mc {

const char* EncoderSettings::binaryName() {
#if defined(Q_OS_WIN)
    return "ffmpeg.exe";
#else
    return "ffmpeg";
#endif
}

std::vector<fs::path> EncoderSettings::defaultSearchLocations() {
#if defined(Q_OS_MACOS)
    return {"/opt/homebrew/bin/ffmpeg",
            "/usr/local/bin/ffmpeg",
            "/opt/local/bin/ffmpeg"};
#elif defined(Q_OS_WIN)
    return {"C:/ffmpeg/bin/ffmpeg.exe",
            "C:/Program Files/ffmpeg/bin/ffmpeg.exe",
            "C:/ProgramData/chocolatey/bin/ffmpeg.exe"};
#else
    return {"/usr/bin/ffmpeg",
            "/usr/local/bin/ffmpeg",
            "/snap/bin/ffmpeg",
            "/var/lib/flatpak/exports/bin/ffmpeg"};
#endif
}

EncoderSettings EncoderSettings::fromConfig() {
    const Config& config = CONFIG;
    const auto& cfg = config.encoder();

    EncoderSettings settings;
    settings.overridePath = cfg.path;
    settings.bundledDir = cfg.bundledDir;
    if (settings.bundledDir.empty() && QCoreApplication::instance()) {
        settings.bundledDir =
                QCoreApplication::applicationDirPath().toStdString();
    }
    settings.searchLocations = cfg.searchPaths.empty()
                                       ? defaultSearchLocations()
                                       : cfg.searchPaths;
    settings.probeTimeout = Duration(cfg.probeTimeoutMs);
    return settings;
}

} // namespace mc
