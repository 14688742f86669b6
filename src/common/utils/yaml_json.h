#ifndef EXPFLOW_COMMON_UTILS_YAML_JSON_H
#define EXPFLOW_COMMON_UTILS_YAML_JSON_H

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

namespace expflow {

// 将 YAML::Node 转换为 nlohmann::json
// Scalars tagged !link (or !@) become {"$link": "<scalar>"}.
nlohmann::json yaml_to_json(const YAML::Node& node);

} // namespace expflow

#endif // EXPFLOW_COMMON_UTILS_YAML_JSON_H
