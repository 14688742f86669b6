// common/utils/links.h
#ifndef EXPFLOW_COMMON_UTILS_LINKS_H
#define EXPFLOW_COMMON_UTILS_LINKS_H

#include "core/types/stage.h"
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace expflow {

// Key of the JSON object that encodes a link: {"$link": "train.model.encoder"}
inline constexpr const char* kLinkKey = "$link";

// A reference from one stage into the output of another.
// "train.model.encoder" -> stage "train", path {"model", "encoder"}
struct LinkRef {
    StageName stage;
    std::vector<std::string> path;
    std::string raw;
};

LinkRef parse_link(const std::string& raw);

nlohmann::json make_link(const std::string& raw);

bool is_link(const nlohmann::json& value);

// Every link in `spec`, depth-first in document order
std::vector<LinkRef> collect_links(const nlohmann::json& spec);

// Replace links to other stages with the value they point at inside `outputs`.
// Links back into `self` are kept as they are.
nlohmann::json resolve_links(const nlohmann::json& spec,
                             const std::unordered_map<StageName, nlohmann::json>& outputs,
                             const StageName& self);

} // namespace expflow

#endif // EXPFLOW_COMMON_UTILS_LINKS_H
