// core/types/environment.h
#ifndef EXPFLOW_CORE_TYPES_ENVIRONMENT_H
#define EXPFLOW_CORE_TYPES_ENVIRONMENT_H

#include "core/types/stage.h"
#include <nlohmann/json.hpp>
#include <string>

namespace expflow {

// Shared, read-only context handed unchanged to every stage of a run.
struct Environment {
    static constexpr const char* kDefaultSavePath = "expflow_output";
    static constexpr const char* kDefaultOutputTemplate = "{{ save_path }}/{{ experiment }}/{{ stage }}";

    std::string experiment;
    std::string save_path = kDefaultSavePath;
    bool debug = false;
    std::string output_template = kDefaultOutputTemplate;
    nlohmann::json extra = nlohmann::json::object();

    // Where a stage writes its artifacts, rendered from output_template
    std::string stage_output_dir(const StageName& stage) const;

    nlohmann::json to_json() const;
};

} // namespace expflow

#endif // EXPFLOW_CORE_TYPES_ENVIRONMENT_H
