#include "log.hpp"
#include <mutex>
#include <vector>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace logging {

namespace {

std::mutex g_mutex;
std::shared_ptr<spdlog::logger> g_logger;

std::shared_ptr<spdlog::logger> make_logger(std::vector<spdlog::sink_ptr> sinks,
                                            spdlog::level::level_enum level) {
    auto logger = std::make_shared<spdlog::logger>("fluxcode", sinks.begin(), sinks.end());
    logger->set_pattern("%Y-%m-%d %H:%M:%S.%e [%l] [%t] %v");
    logger->set_level(level);
    return logger;
}

} // namespace

std::shared_ptr<spdlog::logger> get() {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (!g_logger) {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        g_logger = make_logger(std::move(sinks), spdlog::level::info);
    }
    return g_logger;
}

void init(spdlog::level::level_enum level, const std::string& file_path) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (!file_path.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(file_path, false));
    }
    auto logger = make_logger(std::move(sinks), level);

    std::lock_guard<std::mutex> lock(g_mutex);
    g_logger = std::move(logger);
}

} // namespace logging
