#include "Application.hpp"
#include <QCommandLineParser>
#include <QFile>
#include <QFutureWatcher>
#include <QTimer>
#include <cstdio>
#include <iostream>
#include "Config.hpp"
#include "Logger.hpp"
#include "encoder/EncoderLocator.hpp"
#include "playback/PlaybackTranscoder.hpp"
#include "recorder/CaptureRecorder.hpp"
#include "recorder/OrphanSweep.hpp"
#include "storage/RecordingLocator.hpp"
#include "storage/RecordingNames.hpp"
#include "util/FileUtils.hpp"

namespace mc {

namespace {

Result<Command> parseCommand(const QString& name) {
    if (name == "record")
        return Result<Command>::ok(Command::Record);
    if (name == "play")
        return Result<Command>::ok(Command::Play);
    if (name == "resolve")
        return Result<Command>::ok(Command::Resolve);
    if (name == "sweep")
        return Result<Command>::ok(Command::Sweep);
    if (name == "probe")
        return Result<Command>::ok(Command::Probe);
    return Result<Command>::err("Unknown command: " + name.toStdString());
}

} // namespace

Application::Application(int& argc, char** argv)
    : app_(std::make_unique<QCoreApplication>(argc, argv)) {
    QCoreApplication::setApplicationName("meetcap");
    QCoreApplication::setApplicationVersion("0.1.0");
    QCoreApplication::setOrganizationName("meetcap");
}

Application::~Application() {
    recorder_.reset();
    transcoder_.reset();
    Logger::shutdown();
}

Result<AppOptions> Application::parseArgs() {
    QCommandLineParser parser;
    parser.setApplicationDescription("Meeting capture recorder");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(
            "command", "record | play | resolve | sweep | probe");
    parser.addPositionalArgument(
            "argument", "record: input file or '-'; play: recording filename",
            "[argument]");

    QCommandLineOption configOpt({"c", "config"}, "Config file", "file");
    QCommandLineOption debugOpt({"d", "debug"}, "Enable debug logging");
    QCommandLineOption meetingOpt({"m", "meeting"}, "Meeting id", "id");
    QCommandLineOption storedOpt("stored", "Stored recording filename", "filename");
    QCommandLineOption titleOpt("title", "Meeting title", "title");
    QCommandLineOption dateOpt("date", "Meeting date (ISO 8601)", "date");
    QCommandLineOption attendeeOpt(
            "attendee", "Attendee email or name (repeatable)", "attendee");
    parser.addOptions({configOpt, debugOpt, meetingOpt, storedOpt, titleOpt,
                       dateOpt, attendeeOpt});

    parser.process(*app_);

    auto positional = parser.positionalArguments();
    if (positional.isEmpty())
        return Result<AppOptions>::err("No command given");

    auto command = parseCommand(positional.first());
    if (!command)
        return Result<AppOptions>::err(command.error());

    AppOptions opts;
    opts.command = *command;
    opts.debug = parser.isSet(debugOpt);
    opts.configPath = parser.value(configOpt).toStdString();
    opts.meetingId = parser.value(meetingOpt).toStdString();
    opts.storedFilename = parser.value(storedOpt).toStdString();
    opts.title = parser.value(titleOpt).toStdString();
    opts.date = parser.value(dateOpt).toStdString();
    for (const auto& a : parser.values(attendeeOpt))
        opts.attendees.push_back(a.toStdString());

    auto argument = positional.size() > 1 ? positional.at(1).toStdString()
                                          : std::string();
    switch (opts.command) {
    case Command::Record:
        if (argument.empty() || opts.meetingId.empty())
            return Result<AppOptions>::err(
                    "record needs an input and --meeting");
        opts.input = argument;
        break;
    case Command::Play:
        if (argument.empty())
            return Result<AppOptions>::err("play needs a filename");
        opts.filename = argument;
        break;
    case Command::Resolve:
        if (opts.meetingId.empty())
            return Result<AppOptions>::err("resolve needs --meeting");
        break;
    case Command::Sweep:
    case Command::Probe:
        break;
    }

    return Result<AppOptions>::ok(std::move(opts));
}

Result<void> Application::init(const AppOptions& opts) {
    opts_ = opts;

    Logger::init("meetcap", opts.debug);
    LOG_INFO("meetcap {} starting", QCoreApplication::applicationVersion().toStdString());

    auto& config = CONFIG;
    Result<void> loaded = opts.configPath.empty()
                                  ? config.loadDefault()
                                  : config.load(file::expandHome(opts.configPath));
    if (!loaded) {
        LOG_WARN("Using built-in defaults: {}", loaded.error().message);
    }
    if (config.debug() || opts.debug)
        Logger::setDebug(true);

    const Config& settings = config;
    chunkSize_ = static_cast<qint64>(settings.recording().chunkSize);

    auto recorderSettings = RecorderSettings::fromConfig();
    if (!file::ensureDir(recorderSettings.directory)) {
        return Result<void>::err("Cannot create recordings directory " +
                                 recorderSettings.directory.string());
    }

    auto locator = EncoderLocator(EncoderSettings::fromConfig());
    recorder_ = std::make_unique<CaptureRecorder>(recorderSettings, locator);
    transcoder_ = std::make_unique<PlaybackTranscoder>(
            PlaybackSettings::fromConfig(), locator);

    QObject::connect(app_.get(), &QCoreApplication::aboutToQuit, [this] {
        if (recorder_)
            recorder_->discardActive();
    });

    return Result<void>::ok();
}

int Application::exec() {
    switch (opts_.command) {
    case Command::Record:
        return runRecord();
    case Command::Play:
        return runPlay();
    case Command::Resolve:
        return runResolve();
    case Command::Sweep:
        return runSweep();
    case Command::Probe:
        return runProbe();
    }
    return 1;
}

int Application::runSweep() {
    auto report = OrphanSweep::run(recorder_->settings().directory);
    std::cout << "Removed " << report.removed << " orphaned temp file(s)";
    if (report.failed > 0)
        std::cout << ", " << report.failed << " could not be removed";
    std::cout << "\n";
    return report.failed > 0 ? 1 : 0;
}

int Application::runProbe() {
    auto locator = EncoderLocator(EncoderSettings::fromConfig());
    auto encoder = locator.resolve();
    std::cout << "Encoder: " << encoder.path.string()
              << (encoder.probed ? "" : " (from PATH)") << "\n";

    auto available = locator.ensureAvailable(encoder.path);
    if (!available) {
        std::cerr << available.error().message << "\n";
        return 1;
    }

    auto caps = locator.capabilities(encoder.path);
    std::cout << "Video codec: " << caps.videoCodec << "\n"
              << "Audio codec: " << caps.audioCodec.value_or("none") << "\n";
    if (!Logger::logPath().empty())
        std::cout << "Log file: " << Logger::logPath().string() << "\n";
    return 0;
}

int Application::runResolve() {
    auto found = RecordingLocator::resolve(recorder_->settings().directory,
                                           opts_.meetingId,
                                           opts_.storedFilename);
    if (!found) {
        std::cerr << "No recording found for meeting " << opts_.meetingId << "\n";
        return 1;
    }
    std::cout << *found << "\n";
    return 0;
}

int Application::runPlay() {
    auto* watcher = new QFutureWatcher<std::string>(app_.get());
    QObject::connect(watcher, &QFutureWatcher<std::string>::finished, [watcher] {
        std::cout << watcher->result() << "\n";
        watcher->deleteLater();
        QCoreApplication::exit(0);
    });
    watcher->setFuture(transcoder_->ensurePlayable(opts_.filename));
    return app_->exec();
}

int Application::runRecord() {
    OrphanSweep::run(recorder_->settings().directory);

    input_ = std::make_unique<QFile>();
    bool opened = false;
    if (opts_.input == "-") {
        opened = input_->open(stdin, QIODevice::ReadOnly);
    } else {
        input_->setFileName(QString::fromStdString(opts_.input));
        opened = input_->open(QIODevice::ReadOnly);
    }
    if (!opened) {
        std::cerr << "Cannot open " << opts_.input << ": "
                  << input_->errorString().toStdString() << "\n";
        return 1;
    }

    finalFilename_ = RecordingNames::buildRecordingFilename(
            opts_.meetingId,
            opts_.title,
            opts_.date,
            opts_.attendees,
            NamingOptions::fromConfig(),
            ".mp4");
    LOG_DEBUG("Recording will be saved as '{}'", finalFilename_);

    auto started = recorder_->start(opts_.meetingId);
    if (!started) {
        std::cerr << started.error().message << "\n";
        return 1;
    }

    inputTimer_ = new QTimer(app_.get());
    QObject::connect(inputTimer_, &QTimer::timeout, [this] { pumpInput(); });
    inputTimer_->start(0);
    return app_->exec();
}

void Application::pumpInput() {
    // Empty read means end of input (stdin reads block until data or EOF)
    auto chunk = input_->read(chunkSize_);
    if (!chunk.isEmpty()) {
        recorder_->append(opts_.meetingId, std::move(chunk));
        return;
    }

    inputTimer_->stop();
    input_->close();

    using Watcher = QFutureWatcher<Result<std::string>>;
    auto* watcher = new Watcher(app_.get());
    QObject::connect(watcher, &Watcher::finished, [watcher] {
        auto result = watcher->result();
        watcher->deleteLater();
        if (!result) {
            std::cerr << result.error().message << "\n";
            QCoreApplication::exit(1);
            return;
        }
        std::cout << *result << "\n";
        QCoreApplication::exit(0);
    });
    watcher->setFuture(recorder_->stop(opts_.meetingId, finalFilename_));
}

} // namespace mc
