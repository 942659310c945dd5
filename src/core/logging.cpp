#include "logging.hpp"

#include <fmt/format.h>
#include <openssl/rand.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <ctime>
#include <filesystem>
#include <iterator>
#include <random>

#include "../control/config.hpp"

namespace switchyard::logging {

static std::atomic<quill::Logger*> g_logger{nullptr};

void init_logging_system() {
    quill::Backend::start();
}

quill::Logger* init_logger(std::string_view name, const control::LogConfig& log_config) {
    std::string logger_name{name};
    quill::Logger* logger = nullptr;

    if (log_config.output == "stdout") {
        auto console_sink = quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console");
        logger = quill::Frontend::create_or_get_logger(logger_name, std::move(console_sink));
    } else {
        std::filesystem::create_directories(log_config.output);

        quill::RotatingFileSinkConfig config;
        config.set_rotation_max_file_size(log_config.rotation.max_size_mb * 1'000'000);
        config.set_max_backup_files(log_config.rotation.max_files);
        config.set_open_mode('a');

        std::string log_path = fmt::format("{}/{}.log", log_config.output, logger_name);

        if (log_config.format == "json") {
            auto json_sink = quill::Frontend::create_or_get_sink<quill::RotatingJsonFileSink>(
                log_path, config);
            logger = quill::Frontend::create_or_get_logger(logger_name, std::move(json_sink));
        } else {
            auto file_sink =
                quill::Frontend::create_or_get_sink<quill::RotatingFileSink>(log_path, config);
            logger = quill::Frontend::create_or_get_logger(logger_name, std::move(file_sink));
        }
    }

    std::string level_lower = log_config.level;
    std::transform(level_lower.begin(), level_lower.end(), level_lower.begin(), ::tolower);

    if (level_lower == "debug") {
        logger->set_log_level(quill::LogLevel::Debug);
    } else if (level_lower == "warning" || level_lower == "warn") {
        logger->set_log_level(quill::LogLevel::Warning);
    } else if (level_lower == "error") {
        logger->set_log_level(quill::LogLevel::Error);
    } else {
        logger->set_log_level(quill::LogLevel::Info);
    }

    g_logger.store(logger, std::memory_order_release);
    return logger;
}

void shutdown_logging() {
    if (auto* logger = g_logger.load(std::memory_order_acquire)) {
        logger->flush_log();
    }
    quill::Backend::stop();
}

quill::Logger* get_logger() {
    return g_logger.load(std::memory_order_acquire);
}

std::string generate_uuid() {
    std::array<uint8_t, 16> uuid_bytes{};

    // Seeded PRNG only if the OpenSSL RNG is unavailable
    if (RAND_bytes(uuid_bytes.data(), static_cast<int>(uuid_bytes.size())) != 1) {
        static thread_local std::mt19937_64 rng(
            std::random_device{}() ^
            static_cast<uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count()));
        for (size_t i = 0; i < uuid_bytes.size(); i += 8) {
            uint64_t random_val = rng();
            for (size_t b = 0; b < 8; ++b) {
                uuid_bytes[i + b] = static_cast<uint8_t>((random_val >> (b * 8)) & 0xFF);
            }
        }
    }

    // Set version to 4 (random UUID)
    uuid_bytes[6] = (uuid_bytes[6] & 0x0F) | 0x40;
    // Set variant to RFC4122
    uuid_bytes[8] = (uuid_bytes[8] & 0x3F) | 0x80;

    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < uuid_bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out.push_back('-');
        }
        fmt::format_to(std::back_inserter(out), "{:02x}", uuid_bytes[i]);
    }
    return out;
}

bool is_valid_uuid(std::string_view uuid) {
    if (uuid.length() != 36) {
        return false;
    }

    if (uuid[8] != '-' || uuid[13] != '-' || uuid[18] != '-' || uuid[23] != '-') {
        return false;
    }

    // Version nibble
    if (uuid[14] != '4') {
        return false;
    }

    char variant = uuid[19];
    if (variant != '8' && variant != '9' && variant != 'a' && variant != 'b' &&
        variant != 'A' && variant != 'B') {
        return false;
    }

    auto is_hex = [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
    };

    for (size_t i = 0; i < 36; ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23)
            continue;
        if (!is_hex(uuid[i])) return false;
    }

    return true;
}

std::string format_rfc3339(std::chrono::system_clock::time_point tp) {
    std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
    std::tm utc{};
    gmtime_r(&seconds, &utc);

    char buffer[32];
    size_t len = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return std::string(buffer, len);
}

}  // namespace switchyard::logging
