#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>

namespace Vicinity {

/**
 * @brief Logging system wrapper around spdlog
 *
 * The library logger is created on first use with a console sink, so index
 * code can log before the host calls Initialize(). Initialize(), SetLevel()
 * and first use are safe from any thread; Shutdown() must not race logging.
 */
class Logger {
public:
    /**
     * @brief Initialize the logging system
     * @param logFile Optional file path for logging
     * @param consoleOutput Enable console output
     */
    static void Initialize(const std::string& logFile = "",
                          bool consoleOutput = true);

    /**
     * @brief Shutdown the logging system
     */
    static void Shutdown();

    /**
     * @brief Set the minimum log level
     */
    static void SetLevel(spdlog::level::level_enum level);

    /**
     * @brief Get the library logger, initializing it if needed
     */
    static std::shared_ptr<spdlog::logger>& GetLogger();

    [[nodiscard]] static bool IsInitialized() noexcept { return s_initialized.load(std::memory_order_acquire); }

private:
    static void CreateLocked(const std::string& logFile, bool consoleOutput);

    static std::shared_ptr<spdlog::logger> s_logger;
    static std::atomic<bool> s_initialized;
    static std::mutex s_mutex;
};

} // namespace Vicinity

// Convenience macros for library logging
#define VICINITY_LOG_TRACE(...)    ::Vicinity::Logger::GetLogger()->trace(__VA_ARGS__)
#define VICINITY_LOG_DEBUG(...)    ::Vicinity::Logger::GetLogger()->debug(__VA_ARGS__)
#define VICINITY_LOG_INFO(...)     ::Vicinity::Logger::GetLogger()->info(__VA_ARGS__)
#define VICINITY_LOG_WARN(...)     ::Vicinity::Logger::GetLogger()->warn(__VA_ARGS__)
#define VICINITY_LOG_ERROR(...)    ::Vicinity::Logger::GetLogger()->error(__VA_ARGS__)
#define VICINITY_LOG_CRITICAL(...) ::Vicinity::Logger::GetLogger()->critical(__VA_ARGS__)
