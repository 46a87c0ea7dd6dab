#pragma once
// include/townlife/core/Log.hpp
#include <filesystem>
#include <memory>
#include <spdlog/spdlog.h>

namespace townlife::logsys {

struct Options {
    std::filesystem::path     directory;        // empty = console only
    spdlog::level::level_enum level   = spdlog::level::info;
    bool                      console = true;
};

void init(const Options& opts = {});      // rotates townlife.log in opts.directory
std::shared_ptr<spdlog::logger> get();    // "townlife"

} // namespace townlife::logsys
