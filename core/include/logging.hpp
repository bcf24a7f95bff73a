#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/logger.h>
#include <memory>
#include <string>

namespace core {
namespace logging {

    // Call once at start-up (main). Console plus a rotating file
    // <log_dir>/<base_filename>_<UTC start>.log. SPDLOG_LEVEL overrides both levels.
    void initialize(const std::string& base_filename = "swing_trader",
                    spdlog::level::level_enum console_level = spdlog::level::info,
                    spdlog::level::level_enum file_level = spdlog::level::debug,
                    const std::string& log_dir = "logs");

    // Console-only logger for tests and short-lived tools (no log directory, no file sink)
    void initializeConsoleOnly(spdlog::level::level_enum console_level = spdlog::level::warn);

    // Get the globally configured logger
    std::shared_ptr<spdlog::logger>& getLogger();

    // "trace" ... "off"; unknown strings map to info
    spdlog::level::level_enum level_from_string(const std::string& level_str);

} // namespace logging
} // namespace core
