// modules/stage/component_stage_runner.h
#ifndef EXPFLOW_MODULES_STAGE_COMPONENT_STAGE_RUNNER_H
#define EXPFLOW_MODULES_STAGE_COMPONENT_STAGE_RUNNER_H

#include "common/components/registry.h"
#include "modules/stage/stage_runner.h"
#include <memory>

namespace expflow {

// Default runner: resolves the stage's links against its dependency outputs
// and calls the component named by the spec's "type" field.
class ComponentStageRunner : public StageRunner {
public:
    explicit ComponentStageRunner(std::shared_ptr<const ComponentRegistry> registry);

    StageResult run(const StageContext& context) override;

    static StageRunnerFactory factory(std::shared_ptr<const ComponentRegistry> registry);

private:
    std::shared_ptr<const ComponentRegistry> registry_;
};

} // namespace expflow

#endif // EXPFLOW_MODULES_STAGE_COMPONENT_STAGE_RUNNER_H
