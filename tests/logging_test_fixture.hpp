#pragma once

#include "flower/logging.hpp"

#include <filesystem>
#include <memory>

namespace flower::test {

inline std::shared_ptr<spdlog::logger> test_logger() {
    static const std::shared_ptr<spdlog::logger> logger_handle = []() {
        const auto log_dir = std::filesystem::temp_directory_path() / "flower_tests_logs";
        auto logger = flower::initialize_logger(log_dir.string());
        logger->set_level(spdlog::level::warn);
        return logger;
    }();
    return logger_handle;
}

}  // namespace flower::test
