#ifndef POKERCARDS_LOGGING_H
#define POKERCARDS_LOGGING_H

#include <cstddef>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace pokercards {
namespace logging {

constexpr const char* CONSOLE_PATTERN = "%n %l %v";
constexpr const char* FILE_PATTERN = "%Y-%m-%d %H:%M:%S %n %l %v";
constexpr std::size_t DEFAULT_MAX_BYTES = 524288;
constexpr std::size_t DEFAULT_BACKUP_COUNT = 1;

// Logger sans sortie, utilisé par défaut par l'évaluateur
std::shared_ptr<spdlog::logger> null_logger();

// Logger console (stdout couleur), enregistré dans le registre spdlog
std::shared_ptr<spdlog::logger> make_console_logger(
    const std::string& name,
    spdlog::level::level_enum level = spdlog::level::debug,
    const std::string& pattern = CONSOLE_PATTERN);

// Logger fichier avec rotation (max_bytes par fichier, backup_count archives)
std::shared_ptr<spdlog::logger> make_file_logger(
    const std::string& name,
    const std::string& path,
    std::size_t max_bytes = DEFAULT_MAX_BYTES,
    std::size_t backup_count = DEFAULT_BACKUP_COUNT,
    spdlog::level::level_enum level = spdlog::level::debug,
    const std::string& pattern = FILE_PATTERN);

} // namespace logging
} // namespace pokercards

#endif // POKERCARDS_LOGGING_H
