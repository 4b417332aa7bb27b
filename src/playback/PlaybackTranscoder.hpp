/**
 * @file PlaybackTranscoder.hpp
 * @brief On-demand conversion of recordings into a playable MP4.
 *
 * Recordings that are not already in an MP4-family container get a second
 * file, produced by the encoder the first time somebody asks to play them.
 * A WebM recording maps to "<stem>.playback.mp4"; any other container keeps
 * its extension in the name ("<stem>.mkv.playback.mp4") so two sources never
 * share a playback copy. Concurrent requests for the same source share
 * one conversion. A failed conversion is never fatal: the caller receives
 * the original filename and the original file is left alone.
 *
 * @section Dependencies
 * - QProcess, QTimer, QPromise
 * - EncoderLocator, EncodingPlan (File input shape)
 *
 * @section Patterns
 * - Request coalescing: source filename -> shared promise, removed on settle.
 */

#pragma once
#include <QFuture>
#include <QObject>
#include <QProcess>
#include <filesystem>
#include <string>
#include <unordered_map>
#include "encoder/EncoderLocator.hpp"
#include "util/FutureUtils.hpp"
#include "util/Types.hpp"

namespace mc {

struct PlaybackSettings {
    fs::path directory;
    Duration transcodeTimeout{600000};
    usize stderrTailLines{20};

    static PlaybackSettings fromConfig();
};

class PlaybackTranscoder : public QObject {
    Q_OBJECT

public:
    static constexpr const char* kPlaybackSuffix = ".playback.mp4";
    static constexpr const char* kPartialSuffix = ".tmp";

    PlaybackTranscoder(PlaybackSettings settings,
                       EncoderLocator locator,
                       QObject* parent = nullptr);
    ~PlaybackTranscoder() override;

    // Always resolves, to the derived name or to `filename` itself. Jobs
    // still running at destruction resolve to `filename`.
    QFuture<std::string> ensurePlayable(const std::string& filename);

    usize inFlightCount() const {
        return inFlight_.size();
    }
    const PlaybackSettings& settings() const {
        return settings_;
    }

    static bool isPlaybackCompatible(const std::string& filename);
    static std::string playbackFilename(const std::string& filename);

signals:
    void conversionFinished(const QString& source, const QString& result);

private:
    using Promise = SharedPromise<std::string>;

    void startConversion(const std::string& filename, const Promise& promise);
    void finishConversion(const std::string& filename,
                          const Promise& promise,
                          QProcess* process,
                          bool succeeded,
                          const std::string& reason);

    PlaybackSettings settings_;
    EncoderLocator locator_;
    std::unordered_map<std::string, Promise> inFlight_;
};

} // namespace mc
