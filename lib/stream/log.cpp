// SPDX-License-Identifier: MIT

#include "lib/stream/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace seq_pipe {

namespace {

constexpr const char* kLoggerName = "seq_pipe";

std::shared_ptr<spdlog::logger> CreateLogger() {
    if (auto existing = spdlog::get(kLoggerName)) {
        return existing;
    }
    auto logger = spdlog::stderr_color_mt(kLoggerName);
    logger->set_level(spdlog::level::warn);
    return logger;
}

}  // namespace

std::shared_ptr<spdlog::logger> Log() {
    static std::shared_ptr<spdlog::logger> logger = CreateLogger();
    return logger;
}

void SetLogLevel(spdlog::level::level_enum level) {
    Log()->set_level(level);
}

}  // namespace seq_pipe
