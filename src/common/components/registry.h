// common/components/registry.h
#ifndef EXPFLOW_COMMON_COMPONENTS_REGISTRY_H
#define EXPFLOW_COMMON_COMPONENTS_REGISTRY_H

#include "core/types/resource.h"
#include "core/types/search.h"
#include "core/types/stage.h"
#include <functional>
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace expflow {

// Everything a component sees when its stage runs
struct ComponentCall {
    StageName stage;
    nlohmann::json params; // stage spec without "type", links resolved
    AlgorithmConfig algorithm;
    ReductionConfig reduction;
    ResourceRequest resources;
    std::string output_dir;
    bool debug = false;
};

using ComponentFunction = std::function<nlohmann::json(const ComponentCall&)>;

// Named stage implementations, looked up by the "type" field of a stage spec.
// Registration happens before a run; lookups during a run are read-only.
class ComponentRegistry {
public:
    ComponentRegistry(); // 构造时注册内置组件

    template<typename Func>
    void register_component(std::string name, Func&& func) {
        components_[std::move(name)] = std::forward<Func>(func);
    }

    bool has_component(const std::string& name) const;

    // Unknown name -> ConfigError. Exceptions from the component propagate.
    nlohmann::json call_component(const std::string& name, const ComponentCall& call) const;

    std::vector<std::string> list_components() const;

private:
    void register_default_components();
    std::unordered_map<std::string, ComponentFunction> components_;
};

} // namespace expflow

#endif // EXPFLOW_COMMON_COMPONENTS_REGISTRY_H
