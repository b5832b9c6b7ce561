#include "config/ConfigRegistry.hpp"

#include <stdexcept>

namespace ql::config {

void ConfigRegistry::init(const std::filesystem::path& path) {
    std::call_once(init_flag_, [&]() {
        config_ = loadConfig(path);
        initialized_ = true;
    });
}

void ConfigRegistry::init(Config config) {
    std::call_once(init_flag_, [&]() {
        config.validate();
        config_ = std::move(config);
        initialized_ = true;
    });
}

const Config& ConfigRegistry::get() {
    ensureInitialized();
    return config_;
}

void ConfigRegistry::ensureInitialized() {
    if (!initialized_)
        throw std::runtime_error("ConfigRegistry accessed before initialization. Call ConfigRegistry::init() first.");
}

}
