#pragma once

#include <cstdlib>
#include <filesystem>

namespace ql::paths {

inline constexpr auto DEFAULT_CONFIG_PATH = "/etc/quicklink/config.yaml";

inline std::filesystem::path getConfigPath() {
    if (const char* env = std::getenv("QL_CONFIG"); env && *env) return env;
    return DEFAULT_CONFIG_PATH;
}

inline std::filesystem::path getTestLogPath() {
    return std::filesystem::temp_directory_path() / "quicklink_test_logs";
}

}
