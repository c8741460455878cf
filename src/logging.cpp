#include "pokercards/logging.h"

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace pokercards {
namespace logging {

std::shared_ptr<spdlog::logger> null_logger() {
    // Non enregistré : pas de conflit de nom avec le registre global
    static const std::shared_ptr<spdlog::logger> logger =
        std::make_shared<spdlog::logger>("null", std::make_shared<spdlog::sinks::null_sink_mt>());
    return logger;
}

std::shared_ptr<spdlog::logger> make_console_logger(
    const std::string& name, spdlog::level::level_enum level, const std::string& pattern) {
    auto logger = spdlog::get(name);
    if (!logger) {
        logger = spdlog::stdout_color_mt(name);
    }
    logger->set_level(level);
    logger->set_pattern(pattern);
    return logger;
}

std::shared_ptr<spdlog::logger> make_file_logger(
    const std::string& name, const std::string& path, std::size_t max_bytes,
    std::size_t backup_count, spdlog::level::level_enum level, const std::string& pattern) {
    auto logger = spdlog::get(name);
    if (!logger) {
        // spdlog lance spdlog::spdlog_ex si le fichier ne peut pas être ouvert
        logger = spdlog::rotating_logger_mt(name, path, max_bytes, backup_count);
    }
    logger->set_level(level);
    logger->set_pattern(pattern);
    return logger;
}

} // namespace logging
} // namespace pokercards
