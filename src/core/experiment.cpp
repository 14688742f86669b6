// src/core/experiment.cpp
#include "expflow/experiment.h"
#include "common/logging.h"
#include "core/errors.h"
#include "modules/stage/component_stage_runner.h"
#include <stdexcept>

namespace expflow {

std::unique_ptr<Experiment> Experiment::from_yaml(const std::string& yaml_content) {
    ExperimentParser parser;
    return std::make_unique<Experiment>(parser.parse_from_string(yaml_content));
}

std::unique_ptr<Experiment> Experiment::from_file(const std::string& file_path) {
    ExperimentParser parser;
    return std::make_unique<Experiment>(parser.parse_from_file(file_path));
}

Experiment::Experiment(ExperimentConfig config)
    : config_(std::move(config)),
      registry_(std::make_shared<ComponentRegistry>()) {
    if (config_.name.empty()) {
        throw ConfigError("Experiment needs a name");
    }
}

Environment Experiment::default_environment() const {
    Environment env;
    env.experiment = config_.name;
    env.save_path = config_.save_path;
    env.debug = config_.debug;
    env.output_template = config_.output_template;
    return env;
}

void Experiment::run(std::optional<Environment> environment, std::shared_ptr<RuntimeSession> session) {
    logging::set_level(config_.log_level);
    auto log = logging::logger();

    if (!environment) {
        environment = default_environment();
    } else if (environment->experiment.empty()) {
        environment->experiment = config_.name;
    }
    auto env = std::make_shared<const Environment>(std::move(*environment));

    // 未传入会话时为本次运行单独启动一个
    const bool private_session = !session;
    if (private_session) {
        session = RuntimeSession::start(config_.runtime, env->debug);
    } else if (!session->active()) {
        throw std::logic_error("Experiment '" + config_.name + "' was given a session that is shut down");
    }

    last_trace_ = std::make_shared<TraceExporter>(config_.name);
    last_submissions_.clear();

    StageRunnerFactory factory = runner_factory_
        ? runner_factory_
        : ComponentStageRunner::factory(registry_);

    ExperimentScheduler::Config scheduler_config;
    scheduler_config.order = config_.order;
    ExperimentScheduler scheduler(session->runtime(), std::move(factory), scheduler_config, last_trace_);

    log->info("Running experiment '{}' ({} stages, debug={})", config_.name, config_.pipeline.size(), env->debug);
    try {
        scheduler.run(config_.pipeline, config_.algorithms, config_.reductions, config_.budgets, env);
    } catch (...) {
        last_submissions_ = scheduler.submissions();
        if (private_session) {
            // Let running stages finish and fail the rest, then settle the trace
            session->shutdown();
            last_trace_->skip_unstarted("run aborted before the stage started");
        }
        throw;
    }
    last_submissions_ = scheduler.submissions();
    log->info("Experiment '{}' finished", config_.name);
}

std::vector<TraceRecord> Experiment::get_last_traces() const {
    if (!last_trace_) return {};
    return last_trace_->get_traces();
}

nlohmann::json Experiment::trace_json() const {
    if (!last_trace_) return nlohmann::json::array();
    return last_trace_->to_json();
}

} // namespace expflow
