// modules/scheduler/experiment_scheduler.h
#ifndef EXPFLOW_MODULES_SCHEDULER_EXPERIMENT_SCHEDULER_H
#define EXPFLOW_MODULES_SCHEDULER_EXPERIMENT_SCHEDULER_H

#include "core/types/environment.h"
#include "core/types/search.h"
#include "core/types/stage.h"
#include "modules/budget/resource_budget.h"
#include "modules/graph/pipeline_graph.h"
#include "modules/runtime/task_runtime.h"
#include "modules/stage/stage_runner.h"
#include "modules/trace/trace_exporter.h"
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace expflow {

enum class SubmissionOrder : uint8_t {
    DECLARED,    // trust the pipeline's declaration order, reject violations
    TOPOLOGICAL  // compute an order from the dependency graph
};

SubmissionOrder parse_submission_order(const std::string& value);

// What was handed to the runtime for one stage
struct SubmissionRecord {
    StageName stage;
    StageHandle::Id handle_id = 0;
    std::vector<StageName> dependencies;
    std::vector<StageHandle::Id> dependency_ids;
    ResourceRequest resources;
};

// Walks the pipeline in dependency order, submits every stage to the runtime
// without waiting for it, and joins once at the end.
//
// Stages receive their dependencies as unresolved handles; the runtime holds a
// stage back until its inputs exist, so independent branches run concurrently
// while dependent ones serialize on their own.
class ExperimentScheduler {
public:
    struct Config {
        SubmissionOrder order;
        Config() : order(SubmissionOrder::DECLARED) {}
    };

    ExperimentScheduler(TaskRuntime& runtime,
                        StageRunnerFactory runner_factory,
                        Config config = Config(),
                        std::shared_ptr<TraceExporter> trace = nullptr);

    // Returns once every stage succeeded. Configuration problems surface
    // before the first submission; a failed stage surfaces as StageExecutionError.
    void run(const PipelineSpec& pipeline,
             const AlgorithmMap& algorithms,
             const ReductionMap& reductions,
             const ResourceBudgets& budgets,
             std::shared_ptr<const Environment> environment);

    // Submissions of the last run, in submission order
    const std::vector<SubmissionRecord>& submissions() const { return submissions_; }

private:
    struct PlannedStage {
        StageName name;
        SubPipeline pipeline;
        std::vector<StageName> dependencies;
        AlgorithmConfig algorithm;
        ReductionConfig reduction;
        ResourceRequest resources;
    };

    TaskRuntime& runtime_;
    StageRunnerFactory runner_factory_;
    Config config_;
    std::shared_ptr<TraceExporter> trace_;

    std::unordered_map<StageName, StageHandle> handles_; // 阶段 -> 句柄，join 后释放
    std::vector<SubmissionRecord> submissions_;

    std::vector<PlannedStage> plan(const PipelineGraph& graph,
                                   const AlgorithmMap& algorithms,
                                   const ReductionMap& reductions,
                                   const ResourceBudgets& budgets) const;

    StageHandle submit_stage(const PlannedStage& stage,
                             const std::vector<StageHandle>& dependency_handles,
                             const std::shared_ptr<const Environment>& environment);

    void trace_skipped(const std::vector<StageHandle>& submitted);
};

} // namespace expflow

#endif // EXPFLOW_MODULES_SCHEDULER_EXPERIMENT_SCHEDULER_H
