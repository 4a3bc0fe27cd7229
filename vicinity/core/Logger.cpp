#include "core/Logger.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <vector>

namespace Vicinity {

std::shared_ptr<spdlog::logger> Logger::s_logger;
std::atomic<bool> Logger::s_initialized{false};
std::mutex Logger::s_mutex;

void Logger::Initialize(const std::string& logFile, bool consoleOutput) {
    std::lock_guard<std::mutex> lock(s_mutex);
    if (s_initialized.load(std::memory_order_relaxed)) {
        return;
    }
    CreateLocked(logFile, consoleOutput);
}

void Logger::CreateLocked(const std::string& logFile, bool consoleOutput) {
    std::vector<spdlog::sink_ptr> sinks;

    // Console sink
    if (consoleOutput) {
        auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        consoleSink->set_pattern("%^[%T] [%n] [%l]%$ %v");
        sinks.push_back(consoleSink);
    }

    // File sink
    if (!logFile.empty()) {
        auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logFile, 5 * 1024 * 1024, 3);  // 5MB max, 3 files
        fileSink->set_pattern("[%Y-%m-%d %T.%e] [%n] [%l] %v");
        sinks.push_back(fileSink);
    }

    // An empty sink list is valid and silences the library
    s_logger = std::make_shared<spdlog::logger>("VICINITY", sinks.begin(), sinks.end());
    s_logger->set_level(spdlog::level::info);
    s_logger->flush_on(spdlog::level::warn);

    spdlog::drop("VICINITY");
    spdlog::register_logger(s_logger);

    s_initialized.store(true, std::memory_order_release);
}

void Logger::Shutdown() {
    std::lock_guard<std::mutex> lock(s_mutex);
    if (!s_initialized.load(std::memory_order_relaxed)) {
        return;
    }

    s_initialized.store(false, std::memory_order_release);
    s_logger->flush();
    spdlog::drop("VICINITY");
    s_logger.reset();
}

void Logger::SetLevel(spdlog::level::level_enum level) {
    GetLogger()->set_level(level);
}

std::shared_ptr<spdlog::logger>& Logger::GetLogger() {
    if (!s_initialized.load(std::memory_order_acquire)) {
        Initialize();
    }
    return s_logger;
}

} // namespace Vicinity
