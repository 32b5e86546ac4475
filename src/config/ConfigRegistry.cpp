#include "config/ConfigRegistry.hpp"

#include <stdexcept>

namespace bk::config {

void ConfigRegistry::init(const std::filesystem::path& path) {
    std::call_once(init_flag_, [&]() {
        store_ = std::make_unique<ConfigStore>(path);
        store_->load();
        initialized_ = true;
    });
}

ConfigStore& ConfigRegistry::store() {
    ensureInitialized();
    return *store_;
}

void ConfigRegistry::ensureInitialized() {
    if (!initialized_)
        throw std::runtime_error("ConfigRegistry accessed before initialization. Call ConfigRegistry::init() first.");
}

} // namespace bk::config
