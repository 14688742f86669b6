// modules/graph/pipeline_graph.cpp
#include "modules/graph/pipeline_graph.h"
#include "common/utils/links.h"
#include "core/errors.h"
#include <algorithm>
#include <queue>
#include <unordered_set>

namespace expflow {

PipelineGraph::PipelineGraph(PipelineSpec spec) : spec_(std::move(spec)) {
    build_dag();
}

void PipelineGraph::build_dag() {
    // 1. 初始化
    size_t index = 0;
    for (const auto& [name, _] : spec_.stages()) {
        position_[name] = index++;
        dependencies_[name] = {};
        dependents_[name] = {};
    }

    // 2. 从 link 中收集依赖
    for (const auto& [name, stage_spec] : spec_.stages()) {
        std::unordered_set<StageName> seen;
        auto& deps = dependencies_[name];
        for (const auto& link : collect_links(stage_spec)) {
            if (link.stage == name) {
                continue; // internal reference, not a dependency
            }
            if (!spec_.contains(link.stage)) {
                throw UnknownReferenceError(name, link.stage);
            }
            if (seen.insert(link.stage).second) {
                deps.push_back(link.stage);
            }
        }
        std::sort(deps.begin(), deps.end(), [this](const StageName& a, const StageName& b) {
            return position_.at(a) < position_.at(b);
        });
        for (const auto& dep : deps) {
            dependents_[dep].push_back(name);
        }
    }
}

size_t PipelineGraph::position_of(const StageName& stage) const {
    auto it = position_.find(stage);
    if (it == position_.end()) {
        throw UnknownReferenceError("pipeline", stage);
    }
    return it->second;
}

const std::vector<StageName>& PipelineGraph::dependencies_of(const StageName& stage) const {
    position_of(stage);
    return dependencies_.at(stage);
}

const std::vector<StageName>& PipelineGraph::dependents_of(const StageName& stage) const {
    position_of(stage);
    return dependents_.at(stage);
}

SubPipeline PipelineGraph::sub_pipeline(const StageName& stage) const {
    position_of(stage);

    // Transitive closure over dependencies
    std::unordered_set<StageName> included{stage};
    std::vector<StageName> stack{stage};
    while (!stack.empty()) {
        StageName current = std::move(stack.back());
        stack.pop_back();
        for (const auto& dep : dependencies_.at(current)) {
            if (included.insert(dep).second) {
                stack.push_back(dep);
            }
        }
    }

    SubPipeline sub;
    sub.target = stage;
    sub.dependencies = dependencies_.at(stage);
    for (const auto& [name, stage_spec] : spec_.stages()) {
        if (included.count(name) > 0) {
            sub.stages.add_stage(name, stage_spec);
        }
    }
    return sub;
}

std::vector<StageName> PipelineGraph::topological_order() const {
    std::unordered_map<StageName, size_t> in_degree;
    for (const auto& [name, _] : spec_.stages()) {
        in_degree[name] = dependencies_.at(name).size();
    }

    // Min-heap on declaration position keeps the order stable
    auto later = [this](const StageName& a, const StageName& b) {
        return position_.at(a) > position_.at(b);
    };
    std::priority_queue<StageName, std::vector<StageName>, decltype(later)> ready(later);
    for (const auto& [name, degree] : in_degree) {
        if (degree == 0) ready.push(name);
    }

    std::vector<StageName> order;
    order.reserve(spec_.size());
    while (!ready.empty()) {
        StageName current = ready.top();
        ready.pop();
        order.push_back(current);
        for (const auto& next : dependents_.at(current)) {
            if (--in_degree[next] == 0) {
                ready.push(next);
            }
        }
    }

    if (order.size() != spec_.size()) {
        std::vector<StageName> remaining;
        for (const auto& [name, _] : spec_.stages()) {
            if (in_degree[name] > 0) remaining.push_back(name);
        }
        throw CycleError(std::move(remaining));
    }
    return order;
}

bool PipelineGraph::is_declared_order_topological() const {
    for (const auto& [name, _] : spec_.stages()) {
        for (const auto& dep : dependencies_.at(name)) {
            if (position_.at(dep) > position_.at(name)) return false;
        }
    }
    return true;
}

} // namespace expflow
