/**
 * @file CaptureRecorder.hpp
 * @brief Entry point for the capture-to-file pipeline.
 *
 * CaptureRecorder holds the single active RecordingSession slot and exposes
 * the operations the session-management layer calls: start, append, stop and
 * discard. Starting while another meeting is recording discards the older
 * session. A stopped session leaves the slot immediately and is kept alive
 * until its finalize result is available.
 *
 * @section Patterns
 * - Facade: hides encoder resolution, negotiation and process handling.
 * - Single owner: the active session is a unique_ptr, never shared.
 */

#pragma once
#include <QByteArray>
#include <QFuture>
#include <QObject>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "RecorderSettings.hpp"
#include "encoder/EncoderLocator.hpp"
#include "util/Result.hpp"

namespace mc {

class RecordingSession;

class CaptureRecorder : public QObject {
    Q_OBJECT

public:
    CaptureRecorder(RecorderSettings settings,
                    EncoderLocator locator,
                    QObject* parent = nullptr);
    ~CaptureRecorder() override;

    Result<void> start(const std::string& meetingId);

    // Fire-and-forget; chunks for any other meeting are dropped
    void append(const std::string& meetingId, QByteArray chunk);

    QFuture<Result<std::string>> stop(const std::string& meetingId,
                                      const std::string& finalFilename);

    void discard(const std::string& meetingId);
    void discardActive();

    bool isRecording() const {
        return active_ != nullptr;
    }
    std::optional<std::string> activeMeeting() const;
    u64 bytesWritten() const;
    usize finalizingCount() const {
        return finalizing_.size();
    }
    u64 droppedChunks() const {
        return droppedChunks_;
    }
    const RecorderSettings& settings() const {
        return settings_;
    }

    static Result<void> validateFilename(const std::string& filename);

private:
    struct DeleteLater {
        void operator()(RecordingSession* session) const;
    };
    using SessionPtr = std::unique_ptr<RecordingSession, DeleteLater>;

    // Temp path for a new session that no finalizing session is writing
    fs::path freeTempPath(const std::string& meetingId) const;
    void release(RecordingSession* session);

    RecorderSettings settings_;
    EncoderLocator locator_;
    SessionPtr active_;
    std::vector<SessionPtr> finalizing_;
    u64 droppedChunks_{0};
};

} // namespace mc
