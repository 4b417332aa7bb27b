#include "EncoderLocator.hpp"
#include <QFileInfo>
#include <QProcess>
#include <regex>
#include <sstream>
#include "core/Errors.hpp"
#include "core/Logger.hpp"

namespace mc {

std::mutex EncoderLocator::cacheMutex_;
std::map<std::string, EncoderLocator::CacheEntry> EncoderLocator::cache_;

namespace {

struct ProbeOutput {
    bool ok{false};
    std::string stdoutText;
    std::string error;
};

ProbeOutput runProbe(const fs::path& program,
                     const QStringList& args,
                     Duration timeout) {
    QProcess proc;
    proc.setProgram(QString::fromStdString(program.string()));
    proc.setArguments(args);
    proc.setStandardInputFile(QProcess::nullDevice());

    const int waitMs = static_cast<int>(timeout.count());
    proc.start();
    if (!proc.waitForStarted(waitMs)) {
        return {false, {}, proc.errorString().toStdString()};
    }
    if (!proc.waitForFinished(waitMs)) {
        proc.kill();
        proc.waitForFinished(1000);
        return {false, {}, "timed out after " + std::to_string(waitMs) + " ms"};
    }

    ProbeOutput out;
    out.stdoutText = proc.readAllStandardOutput().toStdString();
    if (proc.exitStatus() != QProcess::NormalExit) {
        out.error = "crashed";
    } else if (proc.exitCode() != 0) {
        out.error = "exited with code " + std::to_string(proc.exitCode());
    } else {
        out.ok = true;
    }
    return out;
}

bool isExecutableFile(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec))
        return false;
    return QFileInfo(QString::fromStdString(path.string())).isExecutable();
}

} // namespace

EncoderLocator::EncoderLocator(EncoderSettings settings)
    : settings_(std::move(settings)) {}

ResolvedEncoder EncoderLocator::resolve() const {
    auto env = qEnvironmentVariable(EncoderSettings::kOverrideEnv).trimmed();
    if (!env.isEmpty()) {
        fs::path p = env.toStdString();
        return {p, isExecutableFile(p)};
    }

    if (!settings_.overridePath.empty()) {
        return {settings_.overridePath, isExecutableFile(settings_.overridePath)};
    }

    if (!settings_.bundledDir.empty()) {
        auto bundled = settings_.bundledDir / EncoderSettings::binaryName();
        if (isExecutableFile(bundled))
            return {bundled, true};
    }

    for (const auto& candidate : settings_.searchLocations) {
        if (isExecutableFile(candidate))
            return {candidate, true};
    }

    return {fs::path(EncoderSettings::binaryName()), false};
}

std::string EncoderLocator::overrideHint() const {
    return std::string("Set ") + EncoderSettings::kOverrideEnv +
           " or [encoder] path in config.toml to a working ffmpeg binary.";
}

Result<void> EncoderLocator::ensureAvailable(const fs::path& path) const {
    auto out = runProbe(path, {"-version"}, settings_.probeTimeout);
    if (!out.ok) {
        LOG_ERROR("Encoder check failed for '{}': {}", path.string(), out.error);
        return Result<void>::err(RecorderError::EncoderUnavailable,
                                 "FFmpeg is not available at '" +
                                         path.string() + "' (" + out.error +
                                         "). " + overrideHint());
    }

    std::istringstream lines(out.stdoutText);
    std::string first;
    std::getline(lines, first);
    LOG_DEBUG("Encoder available: {}", first);
    return Result<void>::ok();
}

CodecSet EncoderLocator::parseEncoderList(const std::string& output) {
    // " V....D libx264   libx264 H.264 / AVC ..." ; legend lines carry "="
    static const std::regex line(R"(^\s*[VAS][A-Z.]{5}\s+([A-Za-z0-9_\-]+)\s)");

    CodecSet codecs;
    std::istringstream in(output);
    std::string text;
    while (std::getline(in, text)) {
        std::smatch match;
        if (std::regex_search(text, match, line))
            codecs.insert(match[1].str());
    }
    return codecs;
}

std::optional<EncoderLocator::CacheEntry> EncoderLocator::lookup(
        const fs::path& path) const {
    std::lock_guard lock(cacheMutex_);
    auto it = cache_.find(path.string());
    if (it == cache_.end())
        return std::nullopt;
    return it->second;
}

std::optional<EncoderLocator::CacheEntry> EncoderLocator::probe(
        const fs::path& path) const {
    if (auto hit = lookup(path))
        return hit;

    auto out = runProbe(
            path, {"-hide_banner", "-encoders"}, settings_.probeTimeout);
    if (!out.ok) {
        LOG_WARN("Encoder capability probe failed for '{}': {}",
                 path.string(),
                 out.error);
        return std::nullopt;
    }

    CacheEntry entry;
    entry.codecs = parseEncoderList(out.stdoutText);
    entry.caps = EncodingPlan::negotiate(entry.codecs);
    LOG_INFO("Encoder '{}': {} encoders, video={}, audio={}",
             path.string(),
             entry.codecs.size(),
             entry.caps.videoCodec,
             entry.caps.audioCodec.value_or("none"));

    std::lock_guard lock(cacheMutex_);
    // A concurrent probe may have won; keep the first result
    auto it = cache_.emplace(path.string(), std::move(entry)).first;
    return it->second;
}

CodecSet EncoderLocator::availableCodecs(const fs::path& path) const {
    if (auto entry = probe(path))
        return entry->codecs;
    return {};
}

EncoderCapabilities EncoderLocator::capabilities(const fs::path& path) const {
    if (auto entry = probe(path))
        return entry->caps;
    return EncodingPlan::negotiate({});
}

void EncoderLocator::clearCache() {
    std::lock_guard lock(cacheMutex_);
    cache_.clear();
}

} // namespace mc
