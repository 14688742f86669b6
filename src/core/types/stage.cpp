// core/types/stage.cpp
#include "core/types/stage.h"
#include "core/errors.h"

namespace expflow {

void PipelineSpec::add_stage(StageName name, StageSpec spec) {
    if (name.empty()) {
        throw ConfigError("Stage name must not be empty");
    }
    if (index_.count(name) > 0) {
        throw ConfigError("Duplicate stage name: " + name);
    }
    index_[name] = stages_.size();
    stages_.emplace_back(std::move(name), std::move(spec));
}

bool PipelineSpec::contains(const StageName& name) const {
    return index_.find(name) != index_.end();
}

const StageSpec& PipelineSpec::at(const StageName& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        throw UnknownReferenceError("pipeline", name);
    }
    return stages_[it->second].second;
}

std::vector<StageName> PipelineSpec::names() const {
    std::vector<StageName> out;
    out.reserve(stages_.size());
    for (const auto& [name, _] : stages_) {
        out.push_back(name);
    }
    return out;
}

} // namespace expflow
