#include "Logger.hpp"
#include "util/FileUtils.hpp"

namespace mc {

std::shared_ptr<spdlog::logger> Logger::logger_;
std::filesystem::path Logger::logPath_;

namespace {

spdlog::level::level_enum levelFor(bool debug) {
    return debug ? spdlog::level::debug : spdlog::level::info;
}

// Console output goes to stderr; stdout carries command results
spdlog::sink_ptr makeConsoleSink() {
    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console->set_pattern("%^[%H:%M:%S.%e] [%l]%$ %v");
    return console;
}

} // namespace

void Logger::init(std::string_view appName, bool debug) {
    const std::string name(appName);
    try {
        spdlog::drop(name);

        auto logDir = file::cacheDir() / "logs";
        file::ensureDir(logDir);
        logPath_ = logDir / (name + ".log");

        auto rotating = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logPath_.string(), kMaxFileSize, kMaxFiles);
        rotating->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%s:%#] %v");

        logger_ = std::make_shared<spdlog::logger>(
                name, spdlog::sinks_init_list{makeConsoleSink(), rotating});
        logger_->set_level(levelFor(debug));
        logger_->flush_on(spdlog::level::warn);

        spdlog::register_logger(logger_);
        spdlog::set_default_logger(logger_);

        LOG_DEBUG("Logging to {}", logPath_.string());

    } catch (const spdlog::spdlog_ex& ex) {
        spdlog::drop(name);
        logPath_.clear();
        logger_ = std::make_shared<spdlog::logger>(name, makeConsoleSink());
        logger_->set_level(levelFor(debug));
        spdlog::register_logger(logger_);
        logger_->warn("File logging disabled: {}", ex.what());
    }
}

void Logger::setDebug(bool debug) {
    get()->set_level(levelFor(debug));
}

void Logger::shutdown() {
    if (logger_) {
        logger_->flush();
    }
    logger_.reset();
    logPath_.clear();
    spdlog::shutdown();
}

std::shared_ptr<spdlog::logger>& Logger::get() {
    if (!logger_) {
        init();
    }
    return logger_;
}

} // namespace mc
