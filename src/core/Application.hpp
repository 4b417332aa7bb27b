/**
 * @file Application.hpp
 * @brief Command-line host for the recording pipeline.
 *
 * Wraps QCoreApplication, parses the command line, brings up logging and
 * configuration, and runs one subcommand on the event loop:
 * record, play, resolve, sweep or probe.
 *
 * @section Dependencies
 * - QCoreApplication, QCommandLineParser
 * - CaptureRecorder, PlaybackTranscoder, RecordingLocator, OrphanSweep
 */

#pragma once
#include <QCoreApplication>
#include <memory>
#include <string>
#include <vector>
#include "util/Result.hpp"

class QFile;
class QTimer;

namespace mc {

class CaptureRecorder;
class PlaybackTranscoder;

enum class Command { Record, Play, Resolve, Sweep, Probe };

struct AppOptions {
    Command command{Command::Probe};
    std::string configPath;
    bool debug{false};

    std::string input; // record: file path or "-" for stdin
    std::string filename; // play
    std::string meetingId;
    std::string storedFilename;
    std::string title;
    std::string date;
    std::vector<std::string> attendees;
};

class Application {
public:
    Application(int& argc, char** argv);
    ~Application();

    Result<AppOptions> parseArgs();
    Result<void> init(const AppOptions& opts);
    int exec();

private:
    int runRecord();
    int runPlay();
    int runResolve();
    int runSweep();
    int runProbe();

    void pumpInput();

    std::unique_ptr<QCoreApplication> app_;
    AppOptions opts_;

    std::unique_ptr<CaptureRecorder> recorder_;
    std::unique_ptr<PlaybackTranscoder> transcoder_;
    std::unique_ptr<QFile> input_;
    QTimer* inputTimer_{nullptr};
    qint64 chunkSize_{64 * 1024};
    std::string finalFilename_;
};

} // namespace mc
