// core/types/search.h
#ifndef EXPFLOW_CORE_TYPES_SEARCH_H
#define EXPFLOW_CORE_TYPES_SEARCH_H

#include "core/types/stage.h"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>

namespace expflow {

// --- Search algorithm configuration ---
// Only the configuration lives here; the stage runner decides what to do with it.

// Exhaustive search over every option (default)
struct GridSearch {};

struct RandomSearch {
    int trials = 1;
    std::optional<uint64_t> seed;
};

using AlgorithmConfig = std::variant<GridSearch, RandomSearch>;

// --- Trial reduction configuration ---

struct NoReduction {};

// Keep the k best trials ranked by `metric`
struct TopK {
    int k = 1;
    std::string metric = "metric";
    bool maximize = true;
};

using ReductionConfig = std::variant<NoReduction, TopK>;

using AlgorithmMap = std::unordered_map<StageName, AlgorithmConfig>;
using ReductionMap = std::unordered_map<StageName, ReductionConfig>;

// { "type": "grid" } | { "type": "random", "trials": 10, "seed": 3 }
AlgorithmConfig parse_algorithm(const nlohmann::json& j, const StageName& stage);

// 2 | { "k": 2, "metric": "accuracy", "mode": "max" }
ReductionConfig parse_reduction(const nlohmann::json& j, const StageName& stage);

nlohmann::json to_json(const AlgorithmConfig& algorithm);
nlohmann::json to_json(const ReductionConfig& reduction);

} // namespace expflow

#endif // EXPFLOW_CORE_TYPES_SEARCH_H
