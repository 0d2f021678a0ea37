#pragma once

/// @file log.h
/// spdlog logger construction. Components take a
/// `std::shared_ptr<spdlog::logger>` and never create their own.

#include <spdlog/logger.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace histofy {
namespace logging {

struct LogOptions {
    std::string                          name    = "histofy";
    spdlog::level::level_enum            level   = spdlog::level::info;
    bool                                 console = true;   ///< Colour stderr sink.
    std::optional<std::filesystem::path> file;             ///< Append-mode file sink.
};

/// Build a logger from @p opts. The logger is not registered globally.
std::shared_ptr<spdlog::logger> make_logger(const LogOptions& opts = {});

/// Shared logger that discards everything.
std::shared_ptr<spdlog::logger> null_logger();

/// @p logger, or null_logger() if it is empty.
inline std::shared_ptr<spdlog::logger>
or_null(std::shared_ptr<spdlog::logger> logger) {
    return logger ? std::move(logger) : null_logger();
}

} // namespace logging
} // namespace histofy
