#ifndef EXPFLOW_CORE_TYPES_RESOURCE_H
#define EXPFLOW_CORE_TYPES_RESOURCE_H

#include <nlohmann/json.hpp>

namespace expflow {

// Per-stage allocation handed to the runtime's admission control
struct ResourceRequest {
    int cpus = 1;
    int gpus = 0;

    bool operator==(const ResourceRequest& other) const {
        return cpus == other.cpus && gpus == other.gpus;
    }
};

// Total capacity a runtime can admit at once
struct ResourceCapacity {
    int cpus = 1;
    int gpus = 0;
};

inline nlohmann::json to_json(const ResourceRequest& r) {
    return nlohmann::json{{"cpus", r.cpus}, {"gpus", r.gpus}};
}

} // namespace expflow

#endif // EXPFLOW_CORE_TYPES_RESOURCE_H
