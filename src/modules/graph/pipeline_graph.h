// modules/graph/pipeline_graph.h
#ifndef EXPFLOW_MODULES_GRAPH_PIPELINE_GRAPH_H
#define EXPFLOW_MODULES_GRAPH_PIPELINE_GRAPH_H

#include "core/types/stage.h"
#include <unordered_map>
#include <vector>

namespace expflow {

// A stage together with everything it transitively consumes.
struct SubPipeline {
    StageName target;
    PipelineSpec stages;                 // target + transitive inputs, declaration order
    std::vector<StageName> dependencies; // direct inputs of target
};

// Dependency view over a pipeline. Built once, immutable afterwards.
//
// Dependencies are discovered from the links inside each stage spec. Every link
// must point at a stage of the same pipeline, otherwise construction fails with
// UnknownReferenceError before anything is scheduled.
class PipelineGraph {
public:
    explicit PipelineGraph(PipelineSpec spec);

    const PipelineSpec& spec() const { return spec_; }

    // Direct dependencies in declaration order; never contains `stage` itself
    const std::vector<StageName>& dependencies_of(const StageName& stage) const;

    // Stages that consume `stage` directly
    const std::vector<StageName>& dependents_of(const StageName& stage) const;

    SubPipeline sub_pipeline(const StageName& stage) const;

    std::vector<StageName> declared_order() const { return spec_.names(); }

    // Kahn's algorithm, ties broken by declaration order. Throws CycleError.
    std::vector<StageName> topological_order() const;

    // True when every stage appears after all of its dependencies
    bool is_declared_order_topological() const;

private:
    PipelineSpec spec_;
    std::unordered_map<StageName, size_t> position_;
    std::unordered_map<StageName, std::vector<StageName>> dependencies_; // 前驱
    std::unordered_map<StageName, std::vector<StageName>> dependents_;   // 后继

    void build_dag();
    size_t position_of(const StageName& stage) const;
};

} // namespace expflow

#endif // EXPFLOW_MODULES_GRAPH_PIPELINE_GRAPH_H
