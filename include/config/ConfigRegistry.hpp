#pragma once

#include "config/Config.hpp"

#include <mutex>

namespace lb::config {

class ConfigRegistry {
public:
    static void init(Config cfg);
    static const Config& get();
    [[nodiscard]] static bool isInitialized();

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline bool initialized_ = false;
    static inline std::once_flag init_flag_;
};

} // namespace lb::config
