// SPDX-License-Identifier: MIT

// lib/stream/log.hpp
#pragma once

#include <memory>

#include <spdlog/spdlog.h>

namespace seq_pipe {

/// Library-wide logger named "seq_pipe", writing to stderr.
///
/// Created on first use at level warn. Applications that configure spdlog
/// themselves can register their own logger under the same name before
/// the first call and it will be picked up instead.
std::shared_ptr<spdlog::logger> Log();

/// Adjust the level of the library logger.
void SetLogLevel(spdlog::level::level_enum level);

}  // namespace seq_pipe
