#include <diagram_model/logger.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <filesystem>

namespace diagram_model {

namespace {

const char* const logger_name = "diagram_text";
const char* const log_pattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] %v";

std::shared_ptr<spdlog::logger>& shared_logger() {
    static std::shared_ptr<spdlog::logger> instance;
    return instance;
}

spdlog::level::level_enum& current_level() {
    static spdlog::level::level_enum level = spdlog::level::info;
    return level;
}

void configure(spdlog::logger& log) {
    log.set_level(current_level());
    log.flush_on(spdlog::level::warn);
    log.set_pattern(log_pattern);
}

} // namespace

std::shared_ptr<spdlog::logger> logger() {
    auto& log = shared_logger();
    if (log) return log;

    try {
        log = spdlog::stderr_color_mt(logger_name);
        configure(*log);
    } catch (const spdlog::spdlog_ex&) {
        log = spdlog::default_logger();
    }
    return log;
}

bool set_log_file(const std::string& path) {
    try {
        const std::filesystem::path log_file(path);
        if (log_file.has_parent_path())
            std::filesystem::create_directories(log_file.parent_path());
        spdlog::drop(logger_name);
        auto file_logger = spdlog::basic_logger_mt(logger_name, log_file.string(), true);
        configure(*file_logger);
        shared_logger() = file_logger;
        file_logger->info("Logger initialized. file={}", log_file.string());
        return true;
    } catch (const spdlog::spdlog_ex& e) {
        logger()->error("cannot open log file {}: {}", path, e.what());
    } catch (const std::filesystem::filesystem_error& e) {
        logger()->error("cannot create log directory for {}: {}", path, e.what());
    }
    return false;
}

void set_log_level(spdlog::level::level_enum level) {
    current_level() = level;
    logger()->set_level(level);
}

} // namespace diagram_model
