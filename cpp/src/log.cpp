#include "histofy/log.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <vector>

namespace histofy {
namespace logging {

std::shared_ptr<spdlog::logger> make_logger(const LogOptions& opts) {
    std::vector<spdlog::sink_ptr> sinks;
    if (opts.console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }
    if (opts.file) {
        if (opts.file->has_parent_path())
            std::filesystem::create_directories(opts.file->parent_path());
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
            opts.file->string(), false));
    }
    auto logger = std::make_shared<spdlog::logger>(opts.name, sinks.begin(),
                                                   sinks.end());
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    logger->set_level(opts.level);
    logger->flush_on(spdlog::level::warn);
    return logger;
}

std::shared_ptr<spdlog::logger> null_logger() {
    static auto logger = std::make_shared<spdlog::logger>(
        "histofy-null", std::make_shared<spdlog::sinks::null_sink_mt>());
    return logger;
}

} // namespace logging
} // namespace histofy
