#pragma once

#include "config/ConfigStore.hpp"

#include <memory>
#include <mutex>
#include "paths.hpp"

namespace bk::config {

class ConfigRegistry {
public:
    static void init(const std::filesystem::path& path = paths::getConfigPath());
    static ConfigStore& store();
    static const Config& get() { return store().get(); }

    [[nodiscard]] static bool isInitialized() { return initialized_; }

private:
    static void ensureInitialized();

    static inline std::unique_ptr<ConfigStore> store_;
    static inline bool initialized_ = false;
    static inline std::once_flag init_flag_;
};

} // namespace bk::config
