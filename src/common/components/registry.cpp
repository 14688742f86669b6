#include "common/components/registry.h"
#include "core/errors.h"
#include <algorithm>

namespace expflow {

ComponentRegistry::ComponentRegistry() {
    register_default_components();
}

void ComponentRegistry::register_default_components() {
    // Hands its (resolved) parameters downstream unchanged
    register_component("echo", [](const ComponentCall& call) -> nlohmann::json {
        return call.params;
    });

    register_component("constant", [](const ComponentCall& call) -> nlohmann::json {
        if (!call.params.contains("value")) {
            throw ConfigError("Component 'constant' in stage '" + call.stage + "' requires 'value'");
        }
        return call.params["value"];
    });
}

bool ComponentRegistry::has_component(const std::string& name) const {
    return components_.count(name) > 0;
}

nlohmann::json ComponentRegistry::call_component(const std::string& name, const ComponentCall& call) const {
    auto it = components_.find(name);
    if (it == components_.end()) {
        throw ConfigError("Component not found: " + name + " (stage '" + call.stage + "')");
    }
    return it->second(call);
}

std::vector<std::string> ComponentRegistry::list_components() const {
    std::vector<std::string> names;
    names.reserve(components_.size());
    for (const auto& [name, _] : components_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace expflow
