#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/logger.h>
#include <memory>
#include <string>

namespace core {
namespace logging {

    // Call this once at the beginning of the application (e.g., in main()).
    // A second call replaces the sinks of the existing logger.
    void initialize(const std::string& base_log_filename = "statarb_engine",
                    spdlog::level::level_enum console_level = spdlog::level::info,
                    spdlog::level::level_enum file_level = spdlog::level::debug,
                    const std::string& log_dir = "logs");

    // Get the globally configured logger
    std::shared_ptr<spdlog::logger>& getLogger();

    // Helper function to set log level from string (useful for env vars/config)
    spdlog::level::level_enum level_from_string(const std::string& level_str);

} // namespace logging
} // namespace core
