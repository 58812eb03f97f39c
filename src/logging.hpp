#pragma once

#include <chrono>
#include <string>

// Console logger, plus a plain file sink when log_file is non-empty.
void setup_logging(const std::string& log_level, const std::string& log_file = "");

// Logs the elapsed time of a scope at debug level.
class ScopedTimer {
public:
    explicit ScopedTimer(std::string operation);
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

    long long elapsed_ms() const;

private:
    std::string operation_;
    std::chrono::steady_clock::time_point start_;
};
