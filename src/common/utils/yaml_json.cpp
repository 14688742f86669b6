// common/utils/yaml_json.cpp
#include "common/utils/yaml_json.h"
#include "common/utils/links.h"
#include "core/errors.h"
#include <yaml-cpp/yaml.h>
#include <stdexcept>
#include <string>
#include <sstream>
#include <cctype>

namespace expflow {

namespace {

bool is_integer(const std::string& s) {
    if (s.empty()) return false;
    size_t start = (s[0] == '-' || s[0] == '+') ? 1 : 0;
    if (start >= s.size()) return false;
    for (size_t i = start; i < s.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

// integers, floats and scientific notation
bool is_numeric(const std::string& s) {
    if (s.empty()) return false;
    std::istringstream iss(s);
    double d;
    iss >> d;
    return !iss.fail() && iss.eof();
}

bool is_link_tag(const std::string& tag) {
    return tag == "!link" || tag == "!@";
}

} // namespace

nlohmann::json yaml_to_json(const YAML::Node& node) {
    if (is_link_tag(node.Tag())) {
        if (!node.IsScalar()) {
            throw ConfigError("Link tag " + node.Tag() + " must be applied to a scalar");
        }
        return make_link(node.Scalar());
    }

    switch (node.Type()) {
        case YAML::NodeType::Null:
            return nullptr;
        case YAML::NodeType::Scalar: {
            const std::string& s = node.Scalar();

            // Quoted scalars carry the "!" non-specific tag and stay strings
            if (node.Tag() == "!") return s;

            if (s == "true")  return true;
            if (s == "false") return false;
            if (s == "~" || s == "null" || s.empty()) return nullptr;

            if (is_numeric(s)) {
                try {
                    if (is_integer(s)) {
                        return std::stoll(s);
                    }
                    return std::stod(s);
                } catch (const std::out_of_range&) {
                    // Too large for a number, keep it as a string
                } catch (const std::invalid_argument&) {
                }
            }
            return s;
        }
        case YAML::NodeType::Sequence: {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto& item : node) {
                arr.push_back(yaml_to_json(item));
            }
            return arr;
        }
        case YAML::NodeType::Map: {
            nlohmann::json obj = nlohmann::json::object();
            for (const auto& kv : node) {
                obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
            }
            return obj;
        }
        default:
            return nullptr;
    }
}

} // namespace expflow
