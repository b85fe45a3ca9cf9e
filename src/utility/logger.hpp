#pragma once

#include <atomic>
#include <chrono>
#include <ctime>
#include <iostream>
#include <mutex>
#include <string>

#include <fmt/format.h>

namespace chromatone {

/**
 * Thread-safe stderr logger.
 *
 * DEBUG messages only exist in builds with DEBUG defined; the other levels
 * are always compiled and filtered by a runtime threshold.
 */
class Logger {
  public:
    enum Level {
        DEBUG_LEVEL = 0,
        INFO_LEVEL = 1,
        WARN_LEVEL = 2,
        ERROR_LEVEL = 3
    };

    static void set_min_level(Level level) {
        min_level().store(level, std::memory_order_relaxed);
    }

    static Level get_min_level() {
        return min_level().load(std::memory_order_relaxed);
    }

    static void log(Level level, const std::string &file, int line,
                    const std::string &message) {
        if (level < get_min_level()) {
            return;
        }

        auto now = std::chrono::system_clock::now();
        std::time_t time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()) %
                  1000;

        std::tm local{};
        {
            std::lock_guard<std::mutex> lock(mutex());
            local = *std::localtime(&time_t);
        }

        std::string filename = file;
        size_t last_slash = filename.find_last_of("/\\");
        if (last_slash != std::string::npos) {
            filename = filename.substr(last_slash + 1);
        }

        std::string out = fmt::format(
            "[{}][{:02}:{:02}:{:02}.{:03}][{}:{}] {}\n",
            level_to_string(level), local.tm_hour, local.tm_min,
            local.tm_sec, static_cast<int>(ms.count()), filename, line,
            message);

        std::lock_guard<std::mutex> lock(mutex());
        std::cerr << out << std::flush;
    }

  private:
    static std::atomic<Level> &min_level() {
        static std::atomic<Level> level{INFO_LEVEL};
        return level;
    }

    static std::mutex &mutex() {
        static std::mutex log_mutex;
        return log_mutex;
    }

    static const char *level_to_string(Level level) {
        switch (level) {
        case DEBUG_LEVEL:
            return "DEBUG";
        case INFO_LEVEL:
            return "INFO ";
        case WARN_LEVEL:
            return "WARN ";
        case ERROR_LEVEL:
            return "ERROR";
        default:
            return "UNKNOWN";
        }
    }
};

} // namespace chromatone

#ifdef DEBUG
#define LOG_DEBUG(msg)                                                         \
    chromatone::Logger::log(chromatone::Logger::DEBUG_LEVEL, __FILE__,         \
                            __LINE__, msg)
#else
#define LOG_DEBUG(msg)                                                         \
    do {                                                                       \
    } while (0)
#endif

#define LOG_INFO(msg)                                                          \
    chromatone::Logger::log(chromatone::Logger::INFO_LEVEL, __FILE__,          \
                            __LINE__, msg)
#define LOG_WARN(msg)                                                          \
    chromatone::Logger::log(chromatone::Logger::WARN_LEVEL, __FILE__,          \
                            __LINE__, msg)
#define LOG_ERROR(msg)                                                         \
    chromatone::Logger::log(chromatone::Logger::ERROR_LEVEL, __FILE__,         \
                            __LINE__, msg)
