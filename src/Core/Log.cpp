#include <HypDisk/Core/Log.h>

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace Hyp::Disk::Log {

namespace {

std::shared_ptr<spdlog::logger> CreateLogger() {
    auto logger = spdlog::get(LOGGER_NAME);
    if (!logger) {
        logger = spdlog::stderr_color_mt(LOGGER_NAME);
        logger->set_level(spdlog::level::warn);
        logger->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
    }
    return logger;
}

} // namespace

std::shared_ptr<spdlog::logger> Get() {
    static std::shared_ptr<spdlog::logger> logger = CreateLogger();
    return logger;
}

void SetLevel(spdlog::level::level_enum level) {
    Get()->set_level(level);
}

void LoadEnvLevels() {
    Get();
    spdlog::cfg::load_env_levels();
}

} // namespace Hyp::Disk::Log
