/**
 * @file RecordingSession.hpp
 * @brief One capture-to-file operation driving an encoder subprocess.
 *
 * A RecordingSession owns the encoder process for a single meeting. Capture
 * chunks are queued in arrival order and handed to the process's stdin by a
 * single pump that stops while the pipe holds more than the high-water mark
 * and resumes when the pipe reports progress. The encoder writes straight to
 * the session's temp file; finalize() promotes that file to its final name
 * with one rename once the encoder has exited cleanly, and discard() tears
 * everything down without validation.
 *
 * All methods must be called from the thread that owns the session (the Qt
 * event loop thread); process notifications arrive on the same thread.
 *
 * @section Dependencies
 * - QProcess, QTimer, QPromise
 * - EncodingPlan (argument construction)
 *
 * @section Patterns
 * - Producer-Consumer: append() produces, pump() consumes into the pipe.
 * - State latch: finalizing / terminal error / exited are set once.
 */

#pragma once
#include <QByteArray>
#include <QFuture>
#include <QObject>
#include <QProcess>
#include <deque>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include "RecorderSettings.hpp"
#include "StderrTail.hpp"
#include "core/Errors.hpp"
#include "encoder/EncodingPlan.hpp"
#include "util/FutureUtils.hpp"
#include "util/Result.hpp"

class QTimer;

namespace mc {

class RecordingSession : public QObject {
    Q_OBJECT

public:
    RecordingSession(std::string meetingId,
                     fs::path tempPath,
                     fs::path encoderPath,
                     EncoderCapabilities caps,
                     const RecorderSettings& settings,
                     QObject* parent = nullptr);
    ~RecordingSession() override;

    // Launches the encoder reading from stdin and writing the temp file
    Result<void> spawn();

    // Dropped silently while finalizing or after a terminal error
    void append(QByteArray chunk);

    // Resolves to the final file name, or an error after the temp file has
    // been removed. Emits settled() once the result is available.
    QFuture<Result<std::string>> finalize(const fs::path& finalPath);

    void discard();

    const std::string& meetingId() const {
        return meetingId_;
    }
    const fs::path& tempPath() const {
        return tempPath_;
    }
    const fs::path& encoderPath() const {
        return encoderPath_;
    }
    const EncoderCapabilities& capabilities() const {
        return caps_;
    }
    u64 bytesWritten() const {
        return bytesWritten_;
    }
    bool isFinalizing() const {
        return finalizing_;
    }
    bool hasTerminalError() const {
        return terminalError_.has_value();
    }
    bool hasExited() const {
        return exited_;
    }
    usize pendingChunks() const {
        return pending_.size();
    }
    std::vector<std::string> stderrTail() const {
        return stderrTail_.lines();
    }
    bool isDrained() const;

signals:
    void drained();
    void exited();
    void settled();

protected:
    // Hands one chunk to the encoder's stdin; returns bytes accepted or -1
    virtual qint64 writeChunk(const QByteArray& chunk);

private:
    using Promise = SharedPromise<Result<std::string>>;

    void pump();
    void onStderrReady();
    void onFinished(int exitCode, QProcess::ExitStatus status);
    void onErrorOccurred(QProcess::ProcessError error);

    void markExited(int exitCode, QProcess::ExitStatus status);
    bool inputOpen() const;
    void dropPending(const char* reason);
    void setTerminalError(std::string message);

    void afterDrain(std::function<void()> fn);
    void afterExit(std::function<void()> fn);
    void killThen(std::function<void()> fn);

    void closeInputAndWait(const Promise& promise, const fs::path& finalPath);
    void publish(const Promise& promise, const fs::path& finalPath);
    void fail(const Promise& promise, RecorderError code, std::string message);
    std::string withStderrTail(std::string message) const;
    void removeTemp();

    std::string meetingId_;
    fs::path encoderPath_;
    EncoderCapabilities caps_;
    fs::path tempPath_;

    Duration finalizeTimeout_;
    Duration discardWait_;
    Duration spawnTimeout_;
    qint64 highWater_;

    QProcess* process_;
    QTimer* finalizeTimer_;

    std::deque<QByteArray> pending_;
    u64 bytesWritten_{0};
    std::optional<std::string> terminalError_;
    StderrTail stderrTail_;

    bool finalizing_{false};
    bool inputClosed_{false};
    bool timedOut_{false};
    bool exited_{false};
    int exitCode_{-1};
    QProcess::ExitStatus exitStatus_{QProcess::NormalExit};
};

} // namespace mc
