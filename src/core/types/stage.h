// core/types/stage.h
#ifndef EXPFLOW_CORE_TYPES_STAGE_H
#define EXPFLOW_CORE_TYPES_STAGE_H

#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace expflow {

// 阶段名称
using StageName = std::string;

// Stage specification. Opaque to the scheduler except for the links it contains.
using StageSpec = nlohmann::json;

// What a stage hands to the stages that consume it.
struct StageResult {
    StageName stage;
    nlohmann::json output;
};

// Ordered mapping stage name -> spec. Declaration order is preserved.
class PipelineSpec {
public:
    PipelineSpec() = default;

    void add_stage(StageName name, StageSpec spec);

    bool contains(const StageName& name) const;
    const StageSpec& at(const StageName& name) const;

    const std::vector<std::pair<StageName, StageSpec>>& stages() const { return stages_; }
    std::vector<StageName> names() const;

    size_t size() const { return stages_.size(); }
    bool empty() const { return stages_.empty(); }

private:
    std::vector<std::pair<StageName, StageSpec>> stages_;
    std::unordered_map<StageName, size_t> index_;
};

} // namespace expflow

#endif // EXPFLOW_CORE_TYPES_STAGE_H
