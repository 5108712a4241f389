#include "flower/logging.hpp"

#include <filesystem>
#include <mutex>
#include <stdexcept>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace flower {

namespace {
std::once_flag logger_once_flag;
std::shared_ptr<spdlog::logger> shared_logger;

constexpr std::size_t k_max_file_size_bytes{10 * 1024 * 1024};
constexpr std::size_t k_max_files{5};
constexpr char k_logger_name[] = "flower";
constexpr char k_log_file_name[] = "flower.log";
constexpr char k_console_pattern[] = "[%l] %v";
constexpr char k_file_pattern[] = R"({"ts":"%Y-%m-%dT%H:%M:%S.%eZ","level":"%l","msg":%v})";

std::filesystem::path prepare_log_directory(const std::string& log_directory) {
    const std::filesystem::path path_log_dir{log_directory};
    std::error_code error_directory;
    std::filesystem::create_directories(path_log_dir, error_directory);
    if (error_directory) {
        throw std::runtime_error(
            "Unable to create log directory at " + path_log_dir.string() + ": " + error_directory.message()
        );
    }
    return path_log_dir;
}

spdlog::sink_ptr make_console_sink() {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern(k_console_pattern);
    return console_sink;
}

spdlog::sink_ptr make_file_sink(const std::filesystem::path& path_log_dir) {
    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        (path_log_dir / k_log_file_name).string(),
        k_max_file_size_bytes,
        k_max_files
    );
    file_sink->set_pattern(k_file_pattern);
    return file_sink;
}

}  // namespace

std::shared_ptr<spdlog::logger> initialize_logger(const std::string& log_directory) {
    std::call_once(logger_once_flag, [&log_directory]() {
        const std::vector<spdlog::sink_ptr> list_sinks{
            make_console_sink(),
            make_file_sink(prepare_log_directory(log_directory))
        };
        auto logger = std::make_shared<spdlog::logger>(k_logger_name, list_sinks.begin(), list_sinks.end());
        logger->set_level(spdlog::level::info);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
        shared_logger = std::move(logger);
    });
    return shared_logger;
}

std::shared_ptr<spdlog::logger> get_logger() {
    if (!shared_logger) {
        throw std::runtime_error("Logger not initialized");
    }
    return shared_logger;
}

std::optional<spdlog::level::level_enum> parse_log_level(std::string_view str_level) {
    const auto level = spdlog::level::from_str(std::string{str_level});
    // from_str maps every unknown name to off.
    if (level == spdlog::level::off && str_level != "off") {
        return std::nullopt;
    }
    return level;
}

void set_log_level(const std::string& str_level) {
    if (!shared_logger) {
        return;
    }
    const auto level = parse_log_level(str_level);
    if (!level.has_value()) {
        shared_logger->warn(R"({{"component":"logging","unknown_level":"{}","fallback":"info"}})", str_level);
        shared_logger->set_level(spdlog::level::info);
        return;
    }
    shared_logger->set_level(level.value());
}

}  // namespace flower
