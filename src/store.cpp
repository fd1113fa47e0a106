#include "store.hpp"
#include "config.hpp"
#include "plugin.hpp"
#include <iostream>

namespace tollgate {

std::unique_ptr<KvStore> create_store(const Config& config, Clock& clock) {
    const std::string& name = config.store.backend;
    if (name.empty() || name == "none") return nullptr;

    auto& registry = PluginRegistry::instance();
    if (!registry.has_store(name)) {
        std::cerr << "[store] Backend '" << name
                  << "' is not available in this build; running without a shared store\n";
        return nullptr;
    }

    return registry.create_store(name, config, clock);
}

} // namespace tollgate
