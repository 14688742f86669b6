// modules/stage/component_stage_runner.cpp
#include "modules/stage/component_stage_runner.h"
#include "common/logging.h"
#include "common/utils/links.h"
#include "core/errors.h"
#include <stdexcept>

namespace expflow {

ComponentStageRunner::ComponentStageRunner(std::shared_ptr<const ComponentRegistry> registry)
    : registry_(std::move(registry)) {
    if (!registry_) {
        throw std::invalid_argument("ComponentStageRunner requires a component registry");
    }
}

StageResult ComponentStageRunner::run(const StageContext& context) {
    const StageSpec& spec = context.pipeline.stages.at(context.name);
    if (!spec.is_object() || !spec.contains("type") || !spec["type"].is_string()) {
        throw ConfigError("Stage '" + context.name + "' needs a string 'type' naming its component");
    }
    std::string type = spec["type"].get<std::string>();

    std::unordered_map<StageName, nlohmann::json> outputs;
    for (const auto& [name, result] : context.inputs) {
        outputs[name] = result.output;
    }

    ComponentCall call;
    call.stage = context.name;
    call.params = resolve_links(spec, outputs, context.name);
    call.params.erase("type");
    call.algorithm = context.algorithm;
    call.reduction = context.reduction;
    call.resources = context.resources;
    if (context.environment) {
        call.output_dir = context.environment->stage_output_dir(context.name);
        call.debug = context.environment->debug;
    }

    logging::logger()->debug("Stage '{}' calling component '{}'", context.name, type);
    return StageResult{context.name, registry_->call_component(type, call)};
}

StageRunnerFactory ComponentStageRunner::factory(std::shared_ptr<const ComponentRegistry> registry) {
    return [registry = std::move(registry)](const StageName&) -> std::unique_ptr<StageRunner> {
        return std::make_unique<ComponentStageRunner>(registry);
    };
}

} // namespace expflow
