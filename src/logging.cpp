#include "logging.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

void setup_logging(const std::string& log_level, const std::string& log_file) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!log_file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false));
    }

    auto logger = std::make_shared<spdlog::logger>("blockscope", sinks.begin(), sinks.end());

    if (log_level == "trace") {
        logger->set_level(spdlog::level::trace);
    } else if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

ScopedTimer::ScopedTimer(std::string operation)
    : operation_(std::move(operation))
    , start_(std::chrono::steady_clock::now())
{}

ScopedTimer::~ScopedTimer() {
    spdlog::debug("{} took {}ms", operation_, elapsed_ms());
}

long long ScopedTimer::elapsed_ms() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_
    ).count();
}
