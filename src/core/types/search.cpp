// core/types/search.cpp
#include "core/types/search.h"
#include "core/errors.h"

namespace expflow {

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

AlgorithmConfig parse_algorithm(const nlohmann::json& j, const StageName& stage) {
    if (j.is_null()) {
        return GridSearch{};
    }
    std::string type;
    if (j.is_string()) {
        type = j.get<std::string>();
    } else if (j.is_object()) {
        type = j.value("type", "grid");
    } else {
        throw ConfigError("'algorithm' for stage '" + stage + "' must be a string or a mapping");
    }

    if (type == "grid") {
        return GridSearch{};
    }
    if (type == "random") {
        RandomSearch random;
        if (j.is_object() && j.contains("trials")) {
            if (!j["trials"].is_number_integer() || j["trials"].get<int>() < 1) {
                throw ConfigError("'trials' for stage '" + stage + "' must be a positive integer");
            }
            random.trials = j["trials"].get<int>();
        }
        if (j.is_object() && j.contains("seed")) {
            if (!j["seed"].is_number_integer()) {
                throw ConfigError("'seed' for stage '" + stage + "' must be an integer");
            }
            random.seed = j["seed"].get<uint64_t>();
        }
        return random;
    }
    throw ConfigError("Unknown search algorithm '" + type + "' for stage '" + stage + "'");
}

ReductionConfig parse_reduction(const nlohmann::json& j, const StageName& stage) {
    if (j.is_null()) {
        return NoReduction{};
    }
    TopK top;
    if (j.is_number_integer()) {
        top.k = j.get<int>();
    } else if (j.is_object()) {
        if (!j.contains("k") || !j["k"].is_number_integer()) {
            throw ConfigError("'reduce' for stage '" + stage + "' requires an integer 'k'");
        }
        top.k = j["k"].get<int>();
        top.metric = j.value("metric", top.metric);
        std::string mode = j.value("mode", "max");
        if (mode != "max" && mode != "min") {
            throw ConfigError("'mode' for stage '" + stage + "' must be 'max' or 'min'");
        }
        top.maximize = (mode == "max");
    } else {
        throw ConfigError("'reduce' for stage '" + stage + "' must be an integer or a mapping");
    }
    if (top.k < 1) {
        throw ConfigError("'reduce' for stage '" + stage + "' must keep at least one trial");
    }
    return top;
}

nlohmann::json to_json(const AlgorithmConfig& algorithm) {
    return std::visit(overloaded{
        [](const GridSearch&) { return nlohmann::json{{"type", "grid"}}; },
        [](const RandomSearch& r) {
            nlohmann::json j{{"type", "random"}, {"trials", r.trials}};
            if (r.seed) j["seed"] = *r.seed;
            return j;
        },
    }, algorithm);
}

nlohmann::json to_json(const ReductionConfig& reduction) {
    return std::visit(overloaded{
        [](const NoReduction&) { return nlohmann::json{{"type", "none"}}; },
        [](const TopK& t) {
            return nlohmann::json{
                {"type", "top_k"},
                {"k", t.k},
                {"metric", t.metric},
                {"mode", t.maximize ? "max" : "min"}
            };
        },
    }, reduction);
}

} // namespace expflow
