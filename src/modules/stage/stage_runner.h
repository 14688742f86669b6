// modules/stage/stage_runner.h
#ifndef EXPFLOW_MODULES_STAGE_STAGE_RUNNER_H
#define EXPFLOW_MODULES_STAGE_STAGE_RUNNER_H

#include "core/types/environment.h"
#include "core/types/resource.h"
#include "core/types/search.h"
#include "core/types/stage.h"
#include "modules/graph/pipeline_graph.h"
#include <functional>
#include <memory>
#include <unordered_map>

namespace expflow {

// Inputs of one stage execution. Built on the worker, once every dependency
// handle has resolved.
struct StageContext {
    StageName name;
    SubPipeline pipeline;
    AlgorithmConfig algorithm;
    ReductionConfig reduction;
    std::unordered_map<StageName, StageResult> inputs; // resolved dependencies
    ResourceRequest resources;
    std::shared_ptr<const Environment> environment;
};

// Executes the logic of one stage. A fresh runner is created per submission.
class StageRunner {
public:
    virtual ~StageRunner() = default;
    virtual StageResult run(const StageContext& context) = 0;
};

using StageRunnerFactory = std::function<std::unique_ptr<StageRunner>(const StageName& stage)>;

} // namespace expflow

#endif // EXPFLOW_MODULES_STAGE_STAGE_RUNNER_H
