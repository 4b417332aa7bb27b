#include "PlaybackTranscoder.hpp"
#include <QTimer>
#include <memory>
#include "core/Config.hpp"
#include "core/Logger.hpp"
#include "recorder/RecorderSettings.hpp"
#include "recorder/StderrTail.hpp"
#include "util/FileUtils.hpp"

namespace mc {

PlaybackSettings PlaybackSettings::fromConfig() {
    const Config& config = CONFIG;
    PlaybackSettings settings;
    settings.directory = RecorderSettings::fromConfig().directory;
    settings.transcodeTimeout = Duration(config.playback().transcodeTimeoutMs);
    settings.stderrTailLines = config.recording().stderrTailLines;
    return settings;
}

PlaybackTranscoder::PlaybackTranscoder(PlaybackSettings settings,
                                       EncoderLocator locator,
                                       QObject* parent)
    : QObject(parent),
      settings_(std::move(settings)),
      locator_(std::move(locator)) {}

PlaybackTranscoder::~PlaybackTranscoder() {
    for (auto* process : findChildren<QProcess*>()) {
        process->disconnect(this);
        process->kill();
        process->waitForFinished(2000);
    }

    std::error_code ec;
    for (auto& [filename, promise] : inFlight_) {
        auto partial = settings_.directory /
                       (playbackFilename(filename) + kPartialSuffix);
        if (!file::removeIfExists(partial, ec) && ec) {
            LOG_WARN("Failed to remove {}: {}", partial.string(), ec.message());
        }
        LOG_DEBUG("Abandoned conversion of {}", filename);
        settle(promise, filename);
    }
    inFlight_.clear();
}

bool PlaybackTranscoder::isPlaybackCompatible(const std::string& filename) {
    auto ext = file::toLower(fs::path(filename).extension().string());
    return ext == ".mp4" || ext == ".m4v" || ext == ".mov";
}

std::string PlaybackTranscoder::playbackFilename(const std::string& filename) {
    fs::path path(filename);
    auto ext = file::toLower(path.extension().string());
    if (ext == ".webm")
        return path.stem().string() + kPlaybackSuffix;
    return path.filename().string() + kPlaybackSuffix;
}

QFuture<std::string> PlaybackTranscoder::ensurePlayable(
        const std::string& filename) {
    if (isPlaybackCompatible(filename))
        return readyFuture(filename);

    std::error_code ec;
    if (!fs::exists(settings_.directory / filename, ec)) {
        LOG_WARN("Cannot prepare '{}' for playback: file not found", filename);
        return readyFuture(filename);
    }

    auto derived = playbackFilename(filename);
    if (fs::exists(settings_.directory / derived, ec)) {
        LOG_DEBUG("Using existing playback copy {}", derived);
        return readyFuture(derived);
    }

    if (auto it = inFlight_.find(filename); it != inFlight_.end()) {
        LOG_DEBUG("Joining in-flight conversion of {}", filename);
        return it->second->future();
    }

    for (const auto& [other, job] : inFlight_) {
        if (playbackFilename(other) == derived) {
            LOG_WARN("Cannot convert {}: {} is already producing {}",
                     filename,
                     other,
                     derived);
            return readyFuture(filename);
        }
    }

    auto promise = makeSharedPromise<std::string>();
    auto future = promise->future();
    inFlight_.emplace(filename, promise);
    startConversion(filename, promise);
    return future;
}

void PlaybackTranscoder::startConversion(const std::string& filename,
                                         const Promise& promise) {
    auto encoder = locator_.resolve();
    if (auto available = locator_.ensureAvailable(encoder.path); !available) {
        finishConversion(filename, promise, nullptr, false,
                         available.error().message);
        return;
    }

    auto caps = locator_.capabilities(encoder.path);
    auto source = settings_.directory / filename;
    auto partial = settings_.directory /
                   (playbackFilename(filename) + kPartialSuffix);

    // Leftover from an interrupted run
    std::error_code ec;
    file::removeIfExists(partial, ec);

    auto* process = new QProcess(this);
    auto* timer = new QTimer(process);
    auto tail = std::make_shared<StderrTail>(settings_.stderrTailLines);
    auto timedOut = std::make_shared<bool>(false);

    process->setProgram(QString::fromStdString(encoder.path.string()));
    process->setArguments(
            EncodingPlan::buildArgs(caps, InputShape::File, source, partial));
    process->setStandardInputFile(QProcess::nullDevice());
    process->setStandardOutputFile(QProcess::nullDevice());

    timer->setSingleShot(true);
    connect(timer, &QTimer::timeout, process, [process, timedOut, filename] {
        *timedOut = true;
        LOG_WARN("Conversion of {} timed out, killing encoder", filename);
        process->kill();
    });

    connect(process, &QProcess::readyReadStandardError, this, [process, tail] {
        tail->append(process->readAllStandardError());
    });

    connect(process,
            &QProcess::finished,
            this,
            [this, process, promise, filename, tail, timedOut](
                    int exitCode, QProcess::ExitStatus status) {
                tail->append(process->readAllStandardError());
                tail->flush();

                std::string reason;
                if (*timedOut) {
                    reason = "timed out after " +
                             std::to_string(settings_.transcodeTimeout.count()) +
                             " ms";
                } else if (status != QProcess::NormalExit) {
                    reason = "encoder crashed";
                } else if (exitCode != 0) {
                    reason = "encoder exited with code " +
                             std::to_string(exitCode);
                }
                if (!reason.empty() && !tail->empty())
                    reason += "\n" + tail->joined();
                finishConversion(filename, promise, process, reason.empty(), reason);
            });

    connect(process,
            &QProcess::errorOccurred,
            this,
            [this, process, promise, filename](QProcess::ProcessError error) {
                // Only a failed start ends the job here; everything else is
                // followed by finished()
                if (error != QProcess::FailedToStart)
                    return;
                finishConversion(filename, promise, process, false,
                                 "failed to start encoder: " +
                                         process->errorString().toStdString());
            });

    LOG_INFO("Converting {} for playback ({})", filename, caps.videoCodec);
    process->start();
    timer->start(settings_.transcodeTimeout);
}

void PlaybackTranscoder::finishConversion(const std::string& filename,
                                          const Promise& promise,
                                          QProcess* process,
                                          bool succeeded,
                                          const std::string& reason) {
    if (process) {
        process->disconnect(this);
        process->deleteLater();
    }

    auto derived = playbackFilename(filename);
    auto partial = settings_.directory / (derived + kPartialSuffix);
    std::string result = filename;
    std::error_code ec;

    if (succeeded) {
        auto size = fs::file_size(partial, ec);
        if (ec || size == 0) {
            succeeded = false;
            LOG_ERROR("Conversion of {} produced no output", filename);
        } else {
            fs::rename(partial, settings_.directory / derived, ec);
            if (ec) {
                succeeded = false;
                LOG_ERROR("Failed to move playback copy of {} into place: {}",
                          filename,
                          ec.message());
            }
        }
    } else {
        LOG_ERROR("Conversion of {} failed: {}", filename, reason);
    }

    if (succeeded) {
        result = derived;
        LOG_INFO("Playback copy ready: {}", derived);
    } else if (file::removeIfExists(partial, ec)) {
        LOG_DEBUG("Removed partial {}", partial.string());
    } else if (ec) {
        LOG_WARN("Failed to remove {}: {}", partial.string(), ec.message());
    }

    inFlight_.erase(filename);
    settle(promise, result);
    emit conversionFinished(QString::fromStdString(filename),
                            QString::fromStdString(result));
}

} // namespace mc
