#include "RecordingSession.hpp"
#include <QTimer>
#include "core/Logger.hpp"
#include "util/FileUtils.hpp"

namespace mc {

RecordingSession::RecordingSession(std::string meetingId,
                                   fs::path tempPath,
                                   fs::path encoderPath,
                                   EncoderCapabilities caps,
                                   const RecorderSettings& settings,
                                   QObject* parent)
    : QObject(parent),
      meetingId_(std::move(meetingId)),
      encoderPath_(std::move(encoderPath)),
      caps_(std::move(caps)),
      tempPath_(std::move(tempPath)),
      finalizeTimeout_(settings.finalizeTimeout),
      discardWait_(settings.discardWait),
      spawnTimeout_(settings.spawnTimeout),
      highWater_(static_cast<qint64>(settings.writeHighWater)),
      process_(new QProcess(this)),
      finalizeTimer_(new QTimer(this)),
      stderrTail_(settings.stderrTailLines) {
    finalizeTimer_->setSingleShot(true);

    connect(process_, &QProcess::bytesWritten, this, [this](qint64) { pump(); });
    connect(process_,
            &QProcess::readyReadStandardError,
            this,
            &RecordingSession::onStderrReady);
    connect(process_,
            &QProcess::finished,
            this,
            &RecordingSession::onFinished);
    connect(process_,
            &QProcess::errorOccurred,
            this,
            &RecordingSession::onErrorOccurred);
}

RecordingSession::~RecordingSession() {
    if (process_->state() != QProcess::NotRunning) {
        process_->disconnect(this);
        process_->kill();
        process_->waitForFinished(static_cast<int>(discardWait_.count()));
    }
}

Result<void> RecordingSession::spawn() {
    const auto args = EncodingPlan::buildArgs(
            caps_, InputShape::LiveStream, fs::path(), tempPath_);

    process_->setProgram(QString::fromStdString(encoderPath_.string()));
    process_->setArguments(args);
    process_->setStandardOutputFile(QProcess::nullDevice());
    process_->start();

    if (!process_->waitForStarted(static_cast<int>(spawnTimeout_.count()))) {
        auto reason = process_->errorString().toStdString();
        LOG_ERROR("Failed to start encoder '{}': {}", encoderPath_.string(), reason);
        return Result<void>::err(RecorderError::EncoderUnavailable,
                                 "Failed to start encoder '" +
                                         encoderPath_.string() + "': " + reason);
    }

    LOG_INFO("Recording meeting {} to {} (video={}, audio={})",
             meetingId_,
             tempPath_.string(),
             caps_.videoCodec,
             caps_.audioCodec.value_or("none"));
    LOG_DEBUG("Encoder command: {} {}",
              encoderPath_.string(),
              args.join(' ').toStdString());
    return Result<void>::ok();
}

void RecordingSession::append(QByteArray chunk) {
    if (finalizing_ || terminalError_ || chunk.isEmpty())
        return;

    // Counted at acceptance so progress is visible before the pipe catches up
    bytesWritten_ += static_cast<u64>(chunk.size());
    pending_.push_back(std::move(chunk));
    pump();
}

bool RecordingSession::inputOpen() const {
    return !inputClosed_ && !exited_ &&
           process_->state() != QProcess::NotRunning;
}

bool RecordingSession::isDrained() const {
    return pending_.empty() && (!inputOpen() || process_->bytesToWrite() == 0);
}

void RecordingSession::pump() {
    while (!pending_.empty()) {
        if (!inputOpen()) {
            dropPending("encoder input is closed");
            break;
        }
        if (process_->bytesToWrite() >= highWater_) {
            // Back-pressure: bytesWritten() from the pipe calls us again
            return;
        }

        QByteArray chunk = std::move(pending_.front());
        pending_.pop_front();

        if (writeChunk(chunk) != chunk.size()) {
            if (!inputOpen()) {
                dropPending("encoder input closed during write");
            } else {
                setTerminalError("Failed to write to encoder: " +
                                 process_->errorString().toStdString());
            }
            break;
        }
    }

    if (isDrained())
        emit drained();
}

qint64 RecordingSession::writeChunk(const QByteArray& chunk) {
    return process_->write(chunk);
}

void RecordingSession::dropPending(const char* reason) {
    if (pending_.empty())
        return;
    LOG_DEBUG("Dropping {} queued chunk(s) for meeting {}: {}",
              pending_.size(),
              meetingId_,
              reason);
    pending_.clear();
}

void RecordingSession::setTerminalError(std::string message) {
    if (terminalError_)
        return;
    LOG_ERROR("Recording for meeting {} failed: {}", meetingId_, message);
    terminalError_ = std::move(message);
    pending_.clear();
}

void RecordingSession::onStderrReady() {
    stderrTail_.append(process_->readAllStandardError());
}

void RecordingSession::onFinished(int exitCode, QProcess::ExitStatus status) {
    markExited(exitCode, status);
}

void RecordingSession::onErrorOccurred(QProcess::ProcessError error) {
    switch (error) {
    case QProcess::FailedToStart:
        setTerminalError("Encoder failed to start: " +
                         process_->errorString().toStdString());
        markExited(-1, QProcess::CrashExit);
        break;
    case QProcess::WriteError:
        // EPIPE: the encoder closed its stdin, most likely because it exited
        LOG_DEBUG("Encoder stdin closed for meeting {}", meetingId_);
        inputClosed_ = true;
        dropPending("broken pipe");
        if (isDrained())
            emit drained();
        break;
    case QProcess::Crashed:
    case QProcess::Timedout:
        // Crashes arrive through finished(); timeouts only come from waitFor*
        break;
    case QProcess::ReadError:
    case QProcess::UnknownError:
        setTerminalError("Encoder I/O error: " +
                         process_->errorString().toStdString());
        break;
    }
}

void RecordingSession::markExited(int exitCode, QProcess::ExitStatus status) {
    if (exited_)
        return;

    stderrTail_.append(process_->readAllStandardError());
    stderrTail_.flush();

    exited_ = true;
    exitCode_ = exitCode;
    exitStatus_ = status;
    dropPending("encoder exited");

    LOG_DEBUG("Encoder for meeting {} exited (code={}, crashed={})",
              meetingId_,
              exitCode,
              status == QProcess::CrashExit);

    emit drained();
    emit exited();
}

void RecordingSession::afterDrain(std::function<void()> fn) {
    if (isDrained()) {
        fn();
        return;
    }
    connect(this, &RecordingSession::drained, this, fn, Qt::SingleShotConnection);
}

void RecordingSession::afterExit(std::function<void()> fn) {
    if (exited_) {
        fn();
        return;
    }
    connect(this, &RecordingSession::exited, this, fn, Qt::SingleShotConnection);
}

void RecordingSession::killThen(std::function<void()> fn) {
    if (exited_) {
        fn();
        return;
    }
    afterExit(std::move(fn));
    process_->kill();
}

QFuture<Result<std::string>> RecordingSession::finalize(
        const fs::path& finalPath) {
    auto promise = makeSharedPromise<Result<std::string>>();
    auto future = promise->future();

    if (finalizing_) {
        settle(promise,
               Result<std::string>::err(RecorderError::NoActiveSession,
                                        "Recording is already being finalized"));
        return future;
    }

    finalizing_ = true;
    LOG_DEBUG("Finalizing meeting {}: {} byte(s) accepted, {} chunk(s) queued",
              meetingId_,
              bytesWritten_,
              pending_.size());

    // Covers draining the queue as well as the encoder's exit
    connect(
            finalizeTimer_,
            &QTimer::timeout,
            this,
            [this, promise] {
                timedOut_ = true;
                LOG_ERROR("Encoder for meeting {} did not finish within {} ms "
                          "({} chunk(s) still queued), killing it",
                          meetingId_,
                          finalizeTimeout_.count(),
                          pending_.size());
                killThen([this, promise] {
                    removeTemp();
                    fail(promise,
                         RecorderError::FinalizeTimeout,
                         withStderrTail("Encoder did not finish within " +
                                        std::to_string(finalizeTimeout_.count()) +
                                        " ms"));
                });
            },
            Qt::SingleShotConnection);
    finalizeTimer_->start(finalizeTimeout_);

    afterDrain([this, promise, finalPath] {
        if (timedOut_)
            return;
        closeInputAndWait(promise, finalPath);
    });
    return future;
}

void RecordingSession::closeInputAndWait(const Promise& promise,
                                         const fs::path& finalPath) {
    if (bytesWritten_ == 0) {
        LOG_WARN("Recording for meeting {} contains no data", meetingId_);
        finalizeTimer_->stop();
        killThen([this, promise] {
            removeTemp();
            fail(promise,
                 RecorderError::EmptyRecording,
                 "Video recording contains no data");
        });
        return;
    }

    if (!inputClosed_) {
        inputClosed_ = true;
        if (!exited_)
            process_->closeWriteChannel();
    }

    afterExit([this, promise, finalPath] {
        if (timedOut_)
            return;
        finalizeTimer_->stop();
        publish(promise, finalPath);
    });
}

void RecordingSession::publish(const Promise& promise,
                               const fs::path& finalPath) {
    if (terminalError_) {
        removeTemp();
        fail(promise, RecorderError::WriteFailed, withStderrTail(*terminalError_));
        return;
    }

    if (exitStatus_ != QProcess::NormalExit || exitCode_ != 0) {
        removeTemp();
        auto what = exitStatus_ == QProcess::CrashExit
                            ? std::string("Encoder crashed")
                            : "Encoder exited with code " + std::to_string(exitCode_);
        fail(promise, RecorderError::EncoderNonZeroExit, withStderrTail(what));
        return;
    }

    std::error_code ec;
    auto size = fs::file_size(tempPath_, ec);
    if (ec || size == 0) {
        removeTemp();
        fail(promise,
             RecorderError::InvalidOutput,
             withStderrTail("Encoder produced no output file"));
        return;
    }

    fs::rename(tempPath_, finalPath, ec);
    if (ec) {
        removeTemp();
        fail(promise,
             RecorderError::FilesystemError,
             "Failed to move recording into place: " + ec.message());
        return;
    }

    LOG_INFO("Finalized {} ({} captured, {} on disk)",
             finalPath.string(),
             file::formatBytes(bytesWritten_),
             file::formatBytes(size));
    settle(promise, Result<std::string>::ok(finalPath.filename().string()));
    emit settled();
}

void RecordingSession::fail(const Promise& promise,
                            RecorderError code,
                            std::string message) {
    LOG_ERROR("Finalize failed for meeting {} [{}]: {}",
              meetingId_,
              toString(code),
              message);
    settle(promise, Result<std::string>::err(code, std::move(message)));
    emit settled();
}

std::string RecordingSession::withStderrTail(std::string message) const {
    auto tail = stderrTail_.joined();
    if (!tail.empty())
        message += "\n" + tail;
    return message;
}

void RecordingSession::discard() {
    finalizing_ = true;
    pending_.clear();

    if (!exited_ && process_->state() != QProcess::NotRunning) {
        inputClosed_ = true;
        process_->closeWriteChannel();
        process_->kill();
        if (!process_->waitForFinished(static_cast<int>(discardWait_.count()))) {
            LOG_WARN("Encoder for meeting {} did not exit after kill",
                     meetingId_);
        }
    }

    removeTemp();
    LOG_INFO("Discarded recording for meeting {}", meetingId_);
}

void RecordingSession::removeTemp() {
    std::error_code ec;
    if (file::removeIfExists(tempPath_, ec)) {
        LOG_DEBUG("Removed {}", tempPath_.string());
    } else if (ec) {
        LOG_WARN("Failed to remove {}: {}", tempPath_.string(), ec.message());
    }
}

} // namespace mc
