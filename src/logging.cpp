#include <spatch/logging.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace spatch {

auto logger() -> std::shared_ptr<spdlog::logger> {
    static auto instance = [] {
        if (auto existing = spdlog::get(logger_name)) return existing;
        auto created = spdlog::stderr_color_mt(logger_name);
        created->set_level(spdlog::level::warn);
        return created;
    }();
    return instance;
}

void set_log_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

}  // namespace spatch
