// expflow/experiment.h
#ifndef EXPFLOW_EXPERIMENT_H
#define EXPFLOW_EXPERIMENT_H

#include "common/components/registry.h"
#include "modules/parser/experiment_parser.h"
#include "modules/runtime/runtime_session.h"
#include "modules/scheduler/experiment_scheduler.h"
#include "modules/stage/stage_runner.h"
#include "modules/trace/trace_exporter.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace expflow {

class Experiment {
public:
    static std::unique_ptr<Experiment> from_yaml(const std::string& yaml_content);
    static std::unique_ptr<Experiment> from_file(const std::string& file_path);

    explicit Experiment(ExperimentConfig config);

    // Submits every stage and blocks until all of them finished.
    // Without an environment one is built from the config; without a session
    // a private one is started for this run and shut down afterwards.
    void run(std::optional<Environment> environment = std::nullopt,
             std::shared_ptr<RuntimeSession> session = nullptr);

    template <typename Func>
    void register_component(std::string name, Func&& func) {
        registry_->register_component(std::move(name), std::forward<Func>(func));
    }

    // Replaces the default component-based runner
    void set_runner_factory(StageRunnerFactory factory) { runner_factory_ = std::move(factory); }

    std::vector<TraceRecord> get_last_traces() const;
    nlohmann::json trace_json() const;

    const std::vector<SubmissionRecord>& get_last_submissions() const { return last_submissions_; }

    const ExperimentConfig& config() const { return config_; }

    Environment default_environment() const;

private:
    ExperimentConfig config_;
    std::shared_ptr<ComponentRegistry> registry_; // ← 每个实验独立的组件表
    StageRunnerFactory runner_factory_;
    std::shared_ptr<TraceExporter> last_trace_;   // 运行中的 stage 仍可能写入
    std::vector<SubmissionRecord> last_submissions_;
};

} // namespace expflow

#endif // EXPFLOW_EXPERIMENT_H
