#include "logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <vector>
#include <memory>
#include <iostream>
#include <cstdlib>
#include <chrono>
#include <ctime>
#include <sstream>
#include <iomanip>      // For std::put_time
#include <filesystem>   // For creating directory (C++17)
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace core {
namespace logging {

    static std::shared_ptr<spdlog::logger> global_logger;

    namespace {

        const char* kLoggerName = "SwingTrader";
        const char* kUtcPattern = "[%Y-%m-%d %H:%M:%S.%e%z] [%^%l%$] [%n] %v";
        constexpr std::size_t kMaxLogFileBytes = 10 * 1024 * 1024;
        constexpr std::size_t kMaxLogFiles = 5;

        // Replaces any previously registered logger so initialize() can be called twice (tests)
        void installLogger(std::vector<spdlog::sink_ptr> sinks, spdlog::level::level_enum level) {
            spdlog::drop(kLoggerName);
            global_logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
            spdlog::register_logger(global_logger);
            spdlog::set_default_logger(global_logger);
            global_logger->set_level(level);
            spdlog::flush_on(spdlog::level::err);
        }

        spdlog::sink_ptr makeConsoleSink(spdlog::level::level_enum level) {
            auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            sink->set_level(level);
            sink->set_pattern(kUtcPattern);
            return sink;
        }

        bool envLevelOverride(spdlog::level::level_enum& level) {
            const char* env_level = std::getenv("SPDLOG_LEVEL");
            if (!env_level) {
                return false;
            }
            level = level_from_string(env_level);
            return true;
        }

        // <dir>/<base>_YYYYmmdd_HHMMSSZ.log; falls back to the working directory
        std::string logFilePath(const std::string& base_filename, std::string log_dir) {
            try {
                std::filesystem::create_directories(log_dir);
            } catch (const std::filesystem::filesystem_error& fs_err) {
                std::cerr << "[Logging] Cannot create log directory '" << log_dir << "': " << fs_err.what() << std::endl;
                log_dir = ".";
            }

            std::time_t started = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
            std::tm utc_tm;
            #ifdef _WIN32
                gmtime_s(&utc_tm, &started);
            #else
                gmtime_r(&started, &utc_tm);
            #endif

            std::ostringstream path;
            path << log_dir << "/" << base_filename << "_" << std::put_time(&utc_tm, "%Y%m%d_%H%M%SZ") << ".log";
            return path.str();
        }

    } // end anonymous namespace

    void initialize(const std::string& base_filename,
                    spdlog::level::level_enum console_level,
                    spdlog::level::level_enum file_level,
                    const std::string& log_dir)
    {
        spdlog::level::level_enum env_level;
        if (envLevelOverride(env_level)) {
            console_level = env_level;
            file_level = env_level;
        }

        std::string log_file_path = logFilePath(base_filename, log_dir);
        try {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file_path, kMaxLogFileBytes, kMaxLogFiles, true);
            file_sink->set_level(file_level);
            file_sink->set_pattern(kUtcPattern);

            installLogger({makeConsoleSink(console_level), file_sink}, std::min(console_level, file_level));
        } catch (const spdlog::spdlog_ex& ex) {
            std::cerr << "[Logging] File log '" << log_file_path << "' unavailable, console only: " << ex.what() << std::endl;
            installLogger({makeConsoleSink(console_level)}, console_level);
            return;
        }

        #ifdef NDEBUG
            const char* build_type_str = "Release";
        #else
            const char* build_type_str = "Debug";
        #endif
        getLogger()->info("Logging initialized (Build Type: {}). Console: {}, File: {} -> {}",
                          build_type_str,
                          spdlog::level::to_string_view(console_level),
                          spdlog::level::to_string_view(file_level),
                          log_file_path);
    }

    void initializeConsoleOnly(spdlog::level::level_enum console_level) {
        envLevelOverride(console_level);
        installLogger({makeConsoleSink(console_level)}, console_level);
    }

    std::shared_ptr<spdlog::logger>& getLogger() {
        if (!global_logger) {
             throw std::runtime_error("Logger accessed before initialization. Call core::logging::initialize() first.");
        }
        return global_logger;
    }

    spdlog::level::level_enum level_from_string(const std::string& level_str) {
        std::string lower_str = level_str;
        std::transform(lower_str.begin(), lower_str.end(), lower_str.begin(),
                       [](unsigned char c){ return std::tolower(c); });
        if (lower_str == "trace") return spdlog::level::trace;
        if (lower_str == "debug") return spdlog::level::debug;
        if (lower_str == "info") return spdlog::level::info;
        if (lower_str == "warn" || lower_str == "warning") return spdlog::level::warn;
        if (lower_str == "error" || lower_str == "err") return spdlog::level::err;
        if (lower_str == "critical" || lower_str == "crit") return spdlog::level::critical;
        if (lower_str == "off") return spdlog::level::off;
        std::cerr << "[Logging] Unrecognized log level string: '" << level_str << "'. Defaulting to 'info'." << std::endl;
        return spdlog::level::info;
    }

} // namespace logging
} // namespace core
