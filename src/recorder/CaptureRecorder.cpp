#include "CaptureRecorder.hpp"
#include <algorithm>
#include "RecordingSession.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "util/FileUtils.hpp"
#include "util/FutureUtils.hpp"

namespace mc {

void CaptureRecorder::DeleteLater::operator()(RecordingSession* session) const {
    if (session)
        session->deleteLater();
}

CaptureRecorder::CaptureRecorder(RecorderSettings settings,
                                 EncoderLocator locator,
                                 QObject* parent)
    : QObject(parent),
      settings_(std::move(settings)),
      locator_(std::move(locator)) {}

CaptureRecorder::~CaptureRecorder() {
    discardActive();
    for (auto& session : finalizing_) {
        session->disconnect(this);
        session->discard();
    }
    finalizing_.clear();
}

Result<void> CaptureRecorder::validateFilename(const std::string& filename) {
    if (filename.empty() || filename == "." || filename == ".." ||
        fs::path(filename).filename().string() != filename ||
        filename.find_first_of("/\\") != std::string::npos) {
        return Result<void>::err(RecorderError::InvalidFilename,
                                 "Not a plain file name: '" + filename + "'");
    }
    if (file::endsWith(filename, ".tmp")) {
        return Result<void>::err(RecorderError::InvalidFilename,
                                 "Final file name uses the reserved .tmp "
                                 "suffix: '" + filename + "'");
    }
    return Result<void>::ok();
}

Result<void> CaptureRecorder::start(const std::string& meetingId) {
    if (auto valid = validateFilename(meetingId); !valid) {
        return Result<void>::err(RecorderError::InvalidFilename,
                                 "Invalid meeting id '" + meetingId + "'");
    }

    if (active_) {
        LOG_WARN("Already recording meeting {}, discarding it for {}",
                 active_->meetingId(),
                 meetingId);
        discardActive();
    }

    if (!file::ensureDir(settings_.directory)) {
        return Result<void>::err(RecorderError::FilesystemError,
                                 "Cannot create recordings directory " +
                                         settings_.directory.string());
    }

    auto encoder = locator_.resolve();
    if (auto available = locator_.ensureAvailable(encoder.path); !available) {
        return available;
    }
    auto caps = locator_.capabilities(encoder.path);

    // Nothing live writes this path, so whatever is there is stale
    auto tempPath = freeTempPath(meetingId);
    std::error_code ec;
    if (file::removeIfExists(tempPath, ec)) {
        LOG_WARN("Removed stale temp file {}", tempPath.string());
    }

    SessionPtr session(new RecordingSession(
            meetingId, tempPath, encoder.path, caps, settings_, this));
    if (auto spawned = session->spawn(); !spawned) {
        session->discard();
        return spawned;
    }

    RecordingSession* raw = session.get();
    connect(raw, &RecordingSession::settled, this, [this, raw] { release(raw); });

    active_ = std::move(session);
    return Result<void>::ok();
}

void CaptureRecorder::append(const std::string& meetingId, QByteArray chunk) {
    if (!active_ || active_->meetingId() != meetingId) {
        ++droppedChunks_;
        LOG_DEBUG("Dropping {} byte chunk for inactive meeting {}",
                  chunk.size(),
                  meetingId);
        return;
    }
    active_->append(std::move(chunk));
}

QFuture<Result<std::string>> CaptureRecorder::stop(
        const std::string& meetingId,
        const std::string& finalFilename) {
    if (!active_ || active_->meetingId() != meetingId) {
        return readyFuture(Result<std::string>::err(
                RecorderError::NoActiveSession,
                "No active video recording for meeting " + meetingId));
    }

    if (auto valid = validateFilename(finalFilename); !valid) {
        return readyFuture(Result<std::string>::err(valid.error()));
    }

    RecordingSession* session = active_.get();
    finalizing_.push_back(std::move(active_));

    LOG_INFO("Stopping recording for meeting {} -> {}", meetingId, finalFilename);
    return session->finalize(settings_.directory / finalFilename);
}

void CaptureRecorder::discard(const std::string& meetingId) {
    if (active_ && active_->meetingId() == meetingId)
        discardActive();
}

void CaptureRecorder::discardActive() {
    if (!active_)
        return;
    active_->disconnect(this);
    active_->discard();
    active_.reset();
}

std::optional<std::string> CaptureRecorder::activeMeeting() const {
    if (!active_)
        return std::nullopt;
    return active_->meetingId();
}

u64 CaptureRecorder::bytesWritten() const {
    return active_ ? active_->bytesWritten() : 0;
}

fs::path CaptureRecorder::freeTempPath(const std::string& meetingId) const {
    for (u32 generation = 0;; ++generation) {
        auto path = settings_.tempPathFor(meetingId, generation);
        bool inUse = std::any_of(finalizing_.begin(),
                                 finalizing_.end(),
                                 [&path](const SessionPtr& s) {
                                     return s->tempPath() == path;
                                 });
        if (!inUse)
            return path;
    }
}

void CaptureRecorder::release(RecordingSession* session) {
    std::erase_if(finalizing_,
                  [session](const SessionPtr& s) { return s.get() == session; });
}

} // namespace mc
