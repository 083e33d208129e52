// rw_logger.h

#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <memory>
#include <string>
#include <vector>

namespace RW {

class Logger {
public:
    // An empty file name logs to the console only.
    static void Init(const std::string& level = "info", const std::string& fileName = "radarwhisper.log") {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[RW] [%H:%M:%S] [%^%l%$] %v");

        std::vector<spdlog::sink_ptr> sinks {console_sink};
        std::string fileError;

        if (!fileName.empty()) {
            try {
                auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(fileName, true);
                file_sink->set_pattern("[RW] [%H:%M:%S] [%l] %v");
                sinks.push_back(file_sink);
            }
            catch (const spdlog::spdlog_ex& e) {
                fileError = e.what();
            }
        }

        auto logger = std::make_shared<spdlog::logger>("RW", sinks.begin(), sinks.end());

        spdlog::set_default_logger(logger);
        spdlog::set_level(spdlog::level::from_str(level));

        if (!fileError.empty()) {
            spdlog::warn("Cannot open log file '{}': {}", fileName, fileError);
        }
    }

    static void Shutdown() {
        spdlog::shutdown();
    }
};

} // namespace RW
