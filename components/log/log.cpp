#include "log.hpp"

#include <filesystem>
#include <mutex>
#include <string>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace {

    constexpr std::size_t max_log_file_size = 1024 * 1024 * 8;
    constexpr std::size_t max_log_files = 3;

    std::mutex& registry_mutex() {
        static std::mutex mutex;
        return mutex;
    }

} // namespace

log_t::log_t(std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger)) {}

log_t log_t::clone() const noexcept { return log_t(logger_); }

void log_t::set_level(level lvl) {
    if (logger_) {
        logger_->set_level(static_cast<spdlog::level::level_enum>(lvl));
    }
}

log_t::level log_t::get_level() const {
    if (!logger_) {
        return level::off;
    }
    return static_cast<level>(logger_->level());
}

bool log_t::is_valid() const noexcept { return logger_ != nullptr; }

void log_t::flush() {
    if (logger_) {
        logger_->flush();
    }
}

log_t initialization_logger(std::string_view name, std::string_view path) {
    std::lock_guard lock(registry_mutex());
    std::string logger_name(name);
    if (auto existing = spdlog::get(logger_name)) {
        return log_t(std::move(existing));
    }

    std::filesystem::path directory(path);
    std::filesystem::create_directories(directory);
    auto file_name = (directory / (logger_name + ".log")).string();

    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(spdlog::level::warn);
    auto file_sink =
        std::make_shared<spdlog::sinks::rotating_file_sink_mt>(file_name, max_log_file_size, max_log_files);
    file_sink->set_level(spdlog::level::trace);

    auto logger = std::make_shared<spdlog::logger>(logger_name, spdlog::sinks_init_list{console_sink, file_sink});
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] [%t] %v");
    logger->set_level(spdlog::level::info);
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
    return log_t(std::move(logger));
}
