#pragma once

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/Logger.h>
#include <quill/LogMacros.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/RotatingFileSink.h>
#include <quill/sinks/RotatingJsonFileSink.h>

#include <chrono>
#include <string>
#include <string_view>

// Forward declaration to avoid circular dependency
namespace switchyard::control {
struct LogConfig;
}

namespace switchyard::logging {

// Initialize Quill logging backend (called once at startup)
void init_logging_system();

// Create (or fetch) a named logger with config-driven sink, format and level.
// output == "stdout" logs to the console, anything else is a log directory
// and gets a rotating <name>.log file.
quill::Logger* init_logger(std::string_view name, const switchyard::control::LogConfig& config);

// Shutdown logging system (called at exit)
void shutdown_logging();

// Process-wide logger (returns nullptr before init_logger)
quill::Logger* get_logger();

// Random UUID v4, used for connection and correlation IDs
std::string generate_uuid();

// Validate UUID format (8-4-4-4-12, version 4)
bool is_valid_uuid(std::string_view uuid);

// RFC 3339 UTC timestamp, second precision (2025-01-02T15:04:05Z)
std::string format_rfc3339(std::chrono::system_clock::time_point tp);

// Connection lifecycle logging
#define LOG_CONNECTION(logger, event, gateway_id, connection_id)                              \
    LOG_INFO(logger, "Gateway connection {}: gateway_id={}, connection_id={}", event, \
             gateway_id, connection_id)

// Error logging with context
#define LOG_ERROR_CTX(logger, message, gateway_id, error_code)                                \
    LOG_ERROR(logger, "{}: gateway_id={}, error_code={}, error_detail={}", message, gateway_id, \
              (error_code).value(), (error_code).message())

}  // namespace switchyard::logging
