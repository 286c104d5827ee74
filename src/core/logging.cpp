#include "core/logging.hpp"
#include "core/config.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <filesystem>
#include <memory>
#include <vector>

namespace fs = std::filesystem;

static constexpr size_t LOG_FILE_MAX_BYTES = 5 * 1024 * 1024;
static constexpr size_t LOG_FILE_COUNT = 3;

void init_logging(const std::string& level, const std::string& file) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (!file.empty()) {
        std::string path = Config::expand_home(file);
        try {
            fs::path parent = fs::path(path).parent_path();
            if (!parent.empty()) fs::create_directories(parent);
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                path, LOG_FILE_MAX_BYTES, LOG_FILE_COUNT));
        } catch (const std::exception& e) {
            // Console logging still works; report why the file sink is missing
            spdlog::warn("[Logging] Cannot open log file {}: {}", path, e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("pisite", sinks.begin(), sinks.end());
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    auto lvl = spdlog::level::from_str(level);
    if (lvl == spdlog::level::off && level != "off") {
        lvl = spdlog::level::info;
    }
    logger->set_level(lvl);
    logger->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger);
}
