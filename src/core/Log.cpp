// src/core/Log.cpp
#include "townlife/core/Log.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace {
std::mutex                      g_mutex;
std::shared_ptr<spdlog::logger> g_logger;
} // namespace

void townlife::logsys::init(const Options& opts) {
    std::vector<spdlog::sink_ptr> sinks;
    if (opts.console)
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (!opts.directory.empty()) {
        std::error_code ec;
        fs::create_directories(opts.directory, ec);
        if (!ec) {
            auto file = (opts.directory / "townlife.log").string();
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(file, 1 << 20, 4)); // 1MB * 4
        }
    }

    auto logger = std::make_shared<spdlog::logger>("townlife", sinks.begin(), sinks.end());
    logger->set_level(opts.level);
    logger->flush_on(spdlog::level::warn);

    {
        std::lock_guard lock(g_mutex);
        g_logger = logger;
    }
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e][%l][%n] %v");
    spdlog::info("Logging started");
}

std::shared_ptr<spdlog::logger> townlife::logsys::get() {
    std::lock_guard lock(g_mutex);
    return g_logger ? g_logger : spdlog::default_logger();
}
