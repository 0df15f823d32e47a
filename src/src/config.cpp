#include "vt/config.h"

#include <mutex>

namespace vt {

static std::mutex& config_mutex() {
    static std::mutex m;
    return m;
}

static std::shared_ptr<const Config>& config_slot() {
    static std::shared_ptr<const Config> slot = std::make_shared<const Config>();
    return slot;
}

std::shared_ptr<const Config> config() {
    std::lock_guard<std::mutex> lock(config_mutex());
    return config_slot();
}

void setConfig(Config c) {
    auto next = std::make_shared<const Config>(std::move(c));
    std::lock_guard<std::mutex> lock(config_mutex());
    config_slot() = std::move(next);
}

void resetConfig() { setConfig(Config{}); }

}  // namespace vt
