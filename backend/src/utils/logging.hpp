#pragma once
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>

namespace Log
{
    inline spdlog::level::level_enum levelFromName(const std::string& name)
    {
        if (name == "trace") return spdlog::level::trace;
        if (name == "debug") return spdlog::level::debug;
        if (name == "warn") return spdlog::level::warn;
        if (name == "error") return spdlog::level::err;
        if (name == "off") return spdlog::level::off;
        return spdlog::level::info;
    }

    inline void init(const std::string& path = "recall.log", const std::string& level = "info")
    {
        // Create file logger; the terminal belongs to the CLI
        auto file_logger = spdlog::basic_logger_mt("file_logger", path);

        // Make file logger the default
        spdlog::set_default_logger(file_logger);

        // Set global log pattern ONCE
        spdlog::set_pattern("[%d:%m:%Y:%H:%M:%S.%e] [%l] %v");

        // Level and flushing setup
        spdlog::set_level(levelFromName(level));
        spdlog::flush_on(spdlog::level::info);
    }
}
