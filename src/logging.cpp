#include <canvas-merge/logging.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace canvas_merge {

auto logger() -> std::shared_ptr<spdlog::logger> {
    static const auto instance = []() -> std::shared_ptr<spdlog::logger> {
        if (auto existing = spdlog::get("canvas_merge")) return existing;
        try {
            auto created = spdlog::stderr_color_mt("canvas_merge");
            created->set_level(spdlog::level::warn);
            created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
            return created;
        } catch (const spdlog::spdlog_ex&) {
            return spdlog::default_logger();
        }
    }();
    return instance;
}

}  // namespace canvas_merge
