// common/utils/links.cpp
#include "common/utils/links.h"
#include "core/errors.h"
#include <cctype>
#include <stdexcept>
#include <string>

namespace expflow {

namespace {

bool is_index(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

void collect_into(const nlohmann::json& value, std::vector<LinkRef>& out) {
    if (is_link(value)) {
        out.push_back(parse_link(value[kLinkKey].get<std::string>()));
        return;
    }
    if (value.is_object() || value.is_array()) {
        for (const auto& child : value) {
            collect_into(child, out);
        }
    }
}

const nlohmann::json& walk(const nlohmann::json& root, const LinkRef& link) {
    const nlohmann::json* current = &root;
    for (const auto& segment : link.path) {
        if (current->is_object()) {
            auto it = current->find(segment);
            if (it == current->end()) {
                throw LinkResolutionError("Link '" + link.raw + "': output of stage '" + link.stage +
                                          "' has no attribute '" + segment + "'");
            }
            current = &(*it);
        } else if (current->is_array() && is_index(segment)) {
            size_t index = 0;
            try {
                index = std::stoul(segment);
            } catch (const std::out_of_range&) {
                throw LinkResolutionError("Link '" + link.raw + "': index " + segment + " out of range");
            }
            if (index >= current->size()) {
                throw LinkResolutionError("Link '" + link.raw + "': index " + segment + " out of range");
            }
            current = &(*current)[index];
        } else {
            throw LinkResolutionError("Link '" + link.raw + "': cannot descend into '" + segment + "'");
        }
    }
    return *current;
}

} // namespace

LinkRef parse_link(const std::string& raw) {
    LinkRef link;
    link.raw = raw;

    size_t start = 0;
    while (true) {
        size_t dot = raw.find('.', start);
        std::string segment = raw.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        if (segment.empty()) {
            throw ConfigError("Malformed link '" + raw + "': empty segment");
        }
        if (link.stage.empty()) {
            link.stage = std::move(segment);
        } else {
            link.path.push_back(std::move(segment));
        }
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    return link;
}

nlohmann::json make_link(const std::string& raw) {
    parse_link(raw); // validate
    return nlohmann::json{{kLinkKey, raw}};
}

bool is_link(const nlohmann::json& value) {
    return value.is_object() && value.size() == 1 && value.contains(kLinkKey) &&
           value[kLinkKey].is_string();
}

std::vector<LinkRef> collect_links(const nlohmann::json& spec) {
    std::vector<LinkRef> links;
    collect_into(spec, links);
    return links;
}

nlohmann::json resolve_links(const nlohmann::json& spec,
                             const std::unordered_map<StageName, nlohmann::json>& outputs,
                             const StageName& self) {
    if (is_link(spec)) {
        LinkRef link = parse_link(spec[kLinkKey].get<std::string>());
        if (link.stage == self) {
            return spec;
        }
        auto it = outputs.find(link.stage);
        if (it == outputs.end()) {
            throw LinkResolutionError("Link '" + link.raw + "': no output available from stage '" +
                                      link.stage + "'");
        }
        return walk(it->second, link);
    }
    if (spec.is_object()) {
        nlohmann::json out = nlohmann::json::object();
        for (auto it = spec.begin(); it != spec.end(); ++it) {
            out[it.key()] = resolve_links(it.value(), outputs, self);
        }
        return out;
    }
    if (spec.is_array()) {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& item : spec) {
            out.push_back(resolve_links(item, outputs, self));
        }
        return out;
    }
    return spec;
}

} // namespace expflow
