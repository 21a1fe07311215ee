#include "./log.hpp"

#include "./environ.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>

using namespace mux;

namespace {

std::shared_ptr<spdlog::logger> create_logger() {
    auto existing = spdlog::get("muxio");
    if (existing) {
        return existing;
    }
    auto logger = spdlog::stderr_color_mt("muxio");
    logger->set_level(spdlog::level::warn);
    if (auto level = mux::getenv("MUX_LOG_LEVEL")) {
        logger->set_level(spdlog::level::from_str(*level));
    }
    return logger;
}

}  // namespace

spdlog::logger& mux::log() {
    static std::shared_ptr<spdlog::logger> instance = create_logger();
    return *instance;
}
