#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace logging {

// Shared "fluxcode" logger. Created on first use with a stderr sink at info level.
std::shared_ptr<spdlog::logger> get();

// Replaces the logger's sinks. An empty file_path keeps logging on stderr only.
// Throws spdlog::spdlog_ex when the file cannot be opened; the previous logger stays in place.
void init(spdlog::level::level_enum level, const std::string& file_path = "");

} // namespace logging
