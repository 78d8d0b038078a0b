#include "core/logging.hpp"
#include "core/config.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <vector>

bool init_logging(const std::string& level, const std::string& file) {
    bool ok = true;
    std::string file_error;

    auto parsed = spdlog::level::from_str(level);
    // from_str maps unknown names to "off"
    if (parsed == spdlog::level::off && level != "off") {
        parsed = spdlog::level::info;
        ok = false;
    }

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (!file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                Config::expand_home(file)));
        } catch (const spdlog::spdlog_ex& e) {
            ok = false;
            file_error = e.what();
        }
    }

    auto logger = std::make_shared<spdlog::logger>("octoscan", sinks.begin(), sinks.end());
    logger->set_level(parsed);
    logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_default_logger(logger);

    if (!file_error.empty()) spdlog::warn("Cannot open log file {}: {}", file, file_error);
    if (!ok) spdlog::warn("Logging set up with fallbacks (level '{}', file '{}')", level, file);
    return ok;
}
