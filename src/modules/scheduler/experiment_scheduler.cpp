// modules/scheduler/experiment_scheduler.cpp
#include "modules/scheduler/experiment_scheduler.h"
#include "common/logging.h"
#include "core/errors.h"
#include <stdexcept>
#include <unordered_set>

namespace expflow {

SubmissionOrder parse_submission_order(const std::string& value) {
    if (value == "declared") return SubmissionOrder::DECLARED;
    if (value == "topological") return SubmissionOrder::TOPOLOGICAL;
    throw ConfigError("Unknown submission order '" + value + "' (expected 'declared' or 'topological')");
}

ExperimentScheduler::ExperimentScheduler(TaskRuntime& runtime,
                                         StageRunnerFactory runner_factory,
                                         Config config,
                                         std::shared_ptr<TraceExporter> trace)
    : runtime_(runtime),
      runner_factory_(std::move(runner_factory)),
      config_(config),
      trace_(std::move(trace)) {
    if (!runner_factory_) {
        throw std::invalid_argument("ExperimentScheduler requires a stage runner factory");
    }
}

std::vector<ExperimentScheduler::PlannedStage> ExperimentScheduler::plan(
    const PipelineGraph& graph,
    const AlgorithmMap& algorithms,
    const ReductionMap& reductions,
    const ResourceBudgets& budgets) const {

    const PipelineSpec& spec = graph.spec();
    for (const auto& [name, _] : algorithms) {
        if (!spec.contains(name)) throw UnknownReferenceError("algorithm", name);
    }
    for (const auto& [name, _] : reductions) {
        if (!spec.contains(name)) throw UnknownReferenceError("reduce", name);
    }
    for (const auto& name : budgets.stages()) {
        if (!spec.contains(name)) throw UnknownReferenceError("resources", name);
    }

    std::vector<StageName> order = config_.order == SubmissionOrder::TOPOLOGICAL
        ? graph.topological_order()
        : graph.declared_order();

    std::unordered_set<StageName> planned;
    std::vector<PlannedStage> stages;
    stages.reserve(order.size());

    for (const auto& name : order) {
        PlannedStage stage;
        stage.name = name;
        stage.dependencies = graph.dependencies_of(name);

        // Every dependency must already be scheduled ahead of this stage
        for (const auto& dep : stage.dependencies) {
            if (planned.count(dep) == 0) {
                throw UnresolvedDependencyError(name, dep);
            }
        }

        stage.pipeline = graph.sub_pipeline(name);
        // Advisory; the runtime's admission control decides how to place it
        stage.resources = budgets.lookup(name);

        auto alg_it = algorithms.find(name);
        stage.algorithm = alg_it != algorithms.end() ? alg_it->second : AlgorithmConfig{GridSearch{}};
        auto red_it = reductions.find(name);
        stage.reduction = red_it != reductions.end() ? red_it->second : ReductionConfig{NoReduction{}};

        planned.insert(name);
        stages.push_back(std::move(stage));
    }
    return stages;
}

void ExperimentScheduler::run(const PipelineSpec& pipeline,
                              const AlgorithmMap& algorithms,
                              const ReductionMap& reductions,
                              const ResourceBudgets& budgets,
                              std::shared_ptr<const Environment> environment) {
    handles_.clear();
    submissions_.clear();

    PipelineGraph graph(pipeline);
    std::vector<PlannedStage> stages = plan(graph, algorithms, reductions, budgets);

    auto log = logging::logger();
    log->info("Submitting {} stages", stages.size());

    std::vector<StageHandle> submitted;
    submitted.reserve(stages.size());
    try {
        for (const auto& stage : stages) {
            std::vector<StageHandle> dependency_handles;
            dependency_handles.reserve(stage.dependencies.size());
            for (const auto& dep : stage.dependencies) {
                auto it = handles_.find(dep);
                if (it == handles_.end()) {
                    throw UnresolvedDependencyError(stage.name, dep);
                }
                dependency_handles.push_back(it->second);
            }

            StageHandle handle = submit_stage(stage, dependency_handles, environment);
            handles_[stage.name] = handle;
            submitted.push_back(handle);
        }

        // 等待所有阶段完成
        runtime_.join(submitted);
    } catch (const StageExecutionError& e) {
        log->error("Experiment aborted: {}", e.what());
        trace_skipped(submitted);
        handles_.clear();
        throw;
    } catch (...) {
        handles_.clear();
        throw;
    }

    handles_.clear();
    log->info("All {} stages completed", stages.size());
}

StageHandle ExperimentScheduler::submit_stage(const PlannedStage& stage,
                                              const std::vector<StageHandle>& dependency_handles,
                                              const std::shared_ptr<const Environment>& environment) {
    std::shared_ptr<StageRunner> runner = runner_factory_(stage.name);
    if (!runner) {
        throw std::logic_error("Stage runner factory returned no runner for '" + stage.name + "'");
    }

    auto context = std::make_shared<StageContext>();
    context->name = stage.name;
    context->pipeline = stage.pipeline;
    context->algorithm = stage.algorithm;
    context->reduction = stage.reduction;
    context->resources = stage.resources;
    context->environment = environment;

    // Record the submission first: a worker may pick the stage up immediately
    if (trace_) {
        trace_->on_stage_submitted(stage.name, stage.dependencies, stage.resources,
                                   to_json(stage.algorithm), to_json(stage.reduction));
    }

    std::shared_ptr<TraceExporter> trace = trace_;
    StageTask task = [runner, context, dependencies = stage.dependencies, trace](
                         const std::vector<StageResult>& inputs) -> StageResult {
        for (size_t i = 0; i < inputs.size() && i < dependencies.size(); ++i) {
            context->inputs[dependencies[i]] = inputs[i];
        }
        if (trace) trace->on_stage_start(context->name);
        try {
            StageResult result = runner->run(*context);
            if (trace) trace->on_stage_end(context->name, "success");
            return result;
        } catch (const std::exception& e) {
            if (trace) trace->on_stage_end(context->name, "failed", std::string(e.what()));
            throw;
        }
    };

    StageHandle handle = runtime_.submit(stage.name, std::move(task), dependency_handles, stage.resources);

    SubmissionRecord record;
    record.stage = stage.name;
    record.handle_id = handle.id();
    record.dependencies = stage.dependencies;
    for (const auto& dep : dependency_handles) {
        record.dependency_ids.push_back(dep.id());
    }
    record.resources = stage.resources;
    submissions_.push_back(std::move(record));

    if (trace_) {
        trace_->set_handle_id(stage.name, handle.id());
    }
    logging::logger()->debug("Submitted stage '{}' (handle {}, {} dependencies, {} cpus, {} gpus)",
                             stage.name, handle.id(), stage.dependencies.size(),
                             stage.resources.cpus, stage.resources.gpus);
    return handle;
}

void ExperimentScheduler::trace_skipped(const std::vector<StageHandle>& submitted) {
    if (!trace_) return;
    for (const auto& handle : submitted) {
        if (!handle.ready()) continue;
        try {
            handle.get();
        } catch (const std::exception& e) {
            // Only stages that never started change state here
            trace_->on_stage_skipped(handle.stage(), e.what());
        }
    }
}

} // namespace expflow
