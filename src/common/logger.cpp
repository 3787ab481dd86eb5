#include "code_sentinel/common/logger.hpp"
#include "code_sentinel/common/constants.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>
#include <filesystem>

namespace code_sentinel {
namespace common {

namespace {

spdlog::sink_ptr makeConsoleSink(spdlog::level::level_enum level) {
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(level);
    return console_sink;
}

}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(LogMode mode, const std::string& log_file, LogLevel level, const LoggingConfig& logging_config) {
    if (initialized_) {
        if (logger_) {
            logger_->warn("[Logger] Already initialized, ignoring duplicate initialization");
        }
        return;
    }

    const char* logger_name = constants::system::LOGGER_NAME;
    if (logger_) {
        spdlog::drop(logger_name);
        logger_.reset();
    }

    try {
        auto spdlog_level = toSpdlogLevel(level);
        std::vector<spdlog::sink_ptr> sinks;

        if (mode == LogMode::FILE_ONLY) {
            if (log_file.empty()) {
                throw std::runtime_error("Log file path required for FILE_ONLY mode");
            }

            std::filesystem::path log_dir = std::filesystem::path(log_file).parent_path();
            std::error_code ec;
            if (!log_dir.empty() && !std::filesystem::exists(log_dir, ec)) {
                std::filesystem::create_directories(log_dir, ec);
            }

            if (ec) {
                std::cerr << "[Logger] Failed to create log directory: " << log_dir
                          << " - " << ec.message() << std::endl;
                std::cerr << "[Logger] Falling back to console output" << std::endl;
                sinks.push_back(makeConsoleSink(spdlog_level));
            } else {
                try {
                    std::string effective_log_file = getLogFileWithSuffix(logging_config.format, log_file);

                    size_t max_size = logging_config.rotation_size_mb * 1024 * 1024;
                    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                        effective_log_file, max_size, logging_config.max_files);
                    file_sink->set_level(spdlog_level);
                    sinks.push_back(file_sink);

                    current_format_ = logging_config.format;
                } catch (const spdlog::spdlog_ex& ex) {
                    std::cerr << "[Logger] Failed to open log file: " << log_file
                              << " - " << ex.what() << std::endl;
                    std::cerr << "[Logger] Falling back to console output" << std::endl;
                    sinks.push_back(makeConsoleSink(spdlog_level));
                }
            }
        } else {
            sinks.push_back(makeConsoleSink(spdlog_level));
            current_format_ = logging_config.format;
        }

        logger_ = std::make_shared<spdlog::logger>(logger_name, sinks.begin(), sinks.end());

        if (current_format_ == LogFormat::JSON) {
            logger_->set_pattern(R"({"timestamp":"%Y-%m-%dT%H:%M:%S.%e","level":"%l","thread":%t,"message":"%v"})");
        } else {
            logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [t%t] %v");
        }

        logger_->set_level(spdlog_level);

        if (mode == LogMode::FILE_ONLY) {
            logger_->flush_on(spdlog::level::warn);
        }

        spdlog::register_logger(logger_);
        initialized_ = true;

    } catch (const std::exception& ex) {
        std::cerr << "[Logger] Initialization failed: " << ex.what() << std::endl;
        logger_ = std::make_shared<spdlog::logger>(logger_name, makeConsoleSink(toSpdlogLevel(level)));
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        logger_->set_level(toSpdlogLevel(level));
        spdlog::register_logger(logger_);
        initialized_ = true;
    }
}

void Logger::setLevel(LogLevel level) {
    if (logger_) {
        logger_->set_level(toSpdlogLevel(level));
    }
}

void Logger::shutdown() {
    if (logger_) {
        logger_->flush();
        spdlog::drop(constants::system::LOGGER_NAME);
        logger_.reset();
    }
    initialized_ = false;
}

void Logger::flush() {
    if (logger_) {
        logger_->flush();
    }
}

spdlog::level::level_enum Logger::toSpdlogLevel(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::WARN: return spdlog::level::warn;
        case LogLevel::INFO: return spdlog::level::info;
        case LogLevel::DEBUG: return spdlog::level::debug;
        default: return spdlog::level::info;
    }
}

std::string Logger::getLogFileWithSuffix(LogFormat format, const std::string& base_path) const {
    if (format != LogFormat::JSON) {
        return base_path;
    }

    std::filesystem::path p(base_path);
    std::string stem = p.stem().string();
    std::string ext = p.extension().string();
    std::string parent = p.parent_path().string();

    return parent.empty() ? stem + ".json" + ext : parent + "/" + stem + ".json" + ext;
}

}}
