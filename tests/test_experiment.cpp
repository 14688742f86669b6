// tests/test_experiment.cpp
#include <catch2/catch_test_macros.hpp>
#include "core/errors.h"
#include "expflow/experiment.h"
#include <chrono>
#include <future>
#include <map>
#include <mutex>
#include <thread>
#include <variant>

using namespace expflow;

namespace {

// Thread-safe record of what each stage's component was called with
struct CallLog {
    std::mutex mutex;
    std::map<StageName, ComponentCall> calls;

    void record(const ComponentCall& call) {
        std::lock_guard<std::mutex> lock(mutex);
        calls[call.stage] = call;
    }
};

const char* kLinkedExperiment = R"(
name: linked
save_path: /tmp/expflow_test
debug: true
log_level: warn
pipeline:
  data:
    type: constant
    value: { path: /data/train.csv, sizes: [16, 32] }
  model:
    type: capture
    dataset: !link data.path
    width: !link data.sizes.1
    depth: 3
    double_depth: !link model.depth
  report:
    type: echo
    trained: !link model.width
algorithm:
  model: { type: random, trials: 3 }
cpus_per_trial:
  model: 1
)";

} // namespace

// Test 1: outputs flow through links into later stages
TEST_CASE("Linked experiment runs end to end", "[experiment]") {
    auto experiment = Experiment::from_yaml(kLinkedExperiment);
    auto log = std::make_shared<CallLog>();
    experiment->register_component("capture", [log](const ComponentCall& call) {
        log->record(call);
        return call.params;
    });

    experiment->run();

    const ComponentCall& model = log->calls.at("model");
    REQUIRE(model.params["dataset"] == "/data/train.csv");
    REQUIRE(model.params["width"] == 32);
    REQUIRE(model.params["depth"] == 3);
    REQUIRE(model.params["double_depth"] == nlohmann::json{{"$link", "model.depth"}});
    REQUIRE_FALSE(model.params.contains("type"));
    REQUIRE(std::get<RandomSearch>(model.algorithm).trials == 3);
    REQUIRE(model.output_dir == "/tmp/expflow_test/linked/model");
    REQUIRE(model.debug);

    auto traces = experiment->get_last_traces();
    REQUIRE(traces.size() == 3);
    for (const auto& record : traces) {
        REQUIRE(record.status == "success");
        REQUIRE(record.trace_id == "linked");
    }
    REQUIRE(traces[2].dependencies == std::vector<StageName>{"model"});

    auto submissions = experiment->get_last_submissions();
    REQUIRE(submissions.size() == 3);
    REQUIRE(submissions[1].dependency_ids == std::vector<StageHandle::Id>{submissions[0].handle_id});

    nlohmann::json trace = experiment->trace_json();
    REQUIRE(trace.size() == 3);
    REQUIRE(trace[1]["algorithm"]["type"] == "random");
    REQUIRE(trace[1].contains("end_time_ms"));
}

// Test 2: a failing stage aborts the run and skips its dependents
TEST_CASE("Failing component aborts the experiment", "[experiment]") {
    auto experiment = Experiment::from_yaml(R"(
name: broken
log_level: "off"
pipeline:
  a: { type: constant, value: 1 }
  b: { type: explode, in: !link a }
  c: { type: echo, in: !link b }
)");
    experiment->register_component("explode", [](const ComponentCall&) -> nlohmann::json {
        throw std::runtime_error("boom");
    });

    try {
        experiment->run();
        FAIL("expected StageExecutionError");
    } catch (const StageExecutionError& e) {
        REQUIRE(e.stage() == "b");
        REQUIRE(e.cause() == "boom");
    }

    auto traces = experiment->get_last_traces();
    REQUIRE(traces.size() == 3);
    REQUIRE(traces[0].status == "success");
    REQUIRE(traces[1].status == "failed");
    REQUIRE(traces[2].status == "skipped");
}

// Stages running at the failure finish; the ones waiting on them are skipped
TEST_CASE("Aborted run settles the trace", "[experiment]") {
    auto experiment = Experiment::from_yaml(R"(
name: aborted
log_level: "off"
runtime: { workers: 2 }
pipeline:
  x: { type: slow }
  y: { type: echo, in: !link x }
  f: { type: explode }
)");
    auto x_started = std::make_shared<std::promise<void>>();
    std::shared_future<void> started = x_started->get_future().share();
    experiment->register_component("slow", [x_started](const ComponentCall&) -> nlohmann::json {
        x_started->set_value();
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        return 1;
    });
    experiment->register_component("explode", [started](const ComponentCall&) -> nlohmann::json {
        started.wait();
        throw std::runtime_error("boom");
    });

    REQUIRE_THROWS_AS(experiment->run(), StageExecutionError);

    auto traces = experiment->get_last_traces();
    REQUIRE(traces.size() == 3);
    REQUIRE(traces[0].stage == "x");
    REQUIRE(traces[0].status == "success");
    REQUIRE(traces[1].stage == "y");
    REQUIRE(traces[1].status == "skipped");
    REQUIRE(traces[1].error.has_value());
    REQUIRE(traces[2].stage == "f");
    REQUIRE(traces[2].status == "failed");
}

TEST_CASE("Unknown component type fails its stage", "[experiment]") {
    auto experiment = Experiment::from_yaml(R"(
name: missing
log_level: "off"
pipeline:
  a: { type: does_not_exist }
)");
    try {
        experiment->run();
        FAIL("expected StageExecutionError");
    } catch (const StageExecutionError& e) {
        REQUIRE(e.stage() == "a");
        REQUIRE(e.cause().find("does_not_exist") != std::string::npos);
    }
}

// Test 3: budgets above the runtime capacity still run, recorded as requested
TEST_CASE("Budget above runtime capacity still runs", "[experiment]") {
    auto experiment = Experiment::from_yaml(R"(
name: greedy
log_level: "off"
runtime: { workers: 1, cpus: 2 }
pipeline:
  a: { type: constant, value: 1 }
  b: { type: echo, in: !link a }
cpus_per_trial: { a: 3 }
gpus_per_trial: { a: 1 }
)");
    experiment->run();

    auto traces = experiment->get_last_traces();
    REQUIRE(traces.size() == 2);
    REQUIRE(traces[0].status == "success");
    REQUIRE(traces[0].resources.cpus == 3);
    REQUIRE(traces[0].resources.gpus == 1);
    REQUIRE(traces[1].status == "success");
}

TEST_CASE("Unknown log level is a configuration error", "[experiment]") {
    auto experiment = Experiment::from_yaml("name: e\nlog_level: chatty\npipeline:\n  a: { type: echo }\n");
    REQUIRE_THROWS_AS(experiment->run(), ConfigError);
}

// Test 4: a caller-owned session outlives several runs
TEST_CASE("Session is reused across runs", "[experiment]") {
    RuntimeOptions options;
    options.workers = 2;
    auto session = RuntimeSession::start(options);

    auto experiment = Experiment::from_yaml(R"(
name: reuse
log_level: "off"
pipeline:
  a: { type: constant, value: 5 }
  b: { type: echo, x: !link a }
)");
    experiment->run(std::nullopt, session);
    auto first = experiment->get_last_submissions();
    experiment->run(std::nullopt, session);
    auto second = experiment->get_last_submissions();

    REQUIRE(session->active());
    REQUIRE(first.size() == 2);
    REQUIRE(second.size() == 2);
    REQUIRE(second[0].handle_id > first[1].handle_id);

    session->shutdown();
    REQUIRE_THROWS_AS(experiment->run(std::nullopt, session), std::logic_error);
}

// Test 5: explicit environment and a custom runner
TEST_CASE("Explicit environment reaches every stage", "[experiment]") {
    ExperimentConfig config;
    config.name = "custom";
    config.log_level = "off";
    config.pipeline.add_stage("a", {{"n", 1}});
    config.pipeline.add_stage("b", {{"n", 2}});

    Experiment experiment(config);
    auto dirs = std::make_shared<std::map<StageName, std::string>>();
    auto mutex = std::make_shared<std::mutex>();

    class DirRunner : public StageRunner {
    public:
        DirRunner(std::shared_ptr<std::map<StageName, std::string>> dirs, std::shared_ptr<std::mutex> mutex)
            : dirs_(std::move(dirs)), mutex_(std::move(mutex)) {}
        StageResult run(const StageContext& context) override {
            std::lock_guard<std::mutex> lock(*mutex_);
            (*dirs_)[context.name] = context.environment->stage_output_dir(context.name);
            return StageResult{context.name, nullptr};
        }

    private:
        std::shared_ptr<std::map<StageName, std::string>> dirs_;
        std::shared_ptr<std::mutex> mutex_;
    };
    experiment.set_runner_factory([dirs, mutex](const StageName&) -> std::unique_ptr<StageRunner> {
        return std::make_unique<DirRunner>(dirs, mutex);
    });

    Environment env;
    env.save_path = "/scratch";
    env.output_template = "{{ save_path }}/{{ stage }}-{{ experiment }}";
    experiment.run(env);

    REQUIRE(dirs->at("a") == "/scratch/a-custom");
    REQUIRE(dirs->at("b") == "/scratch/b-custom");
}

TEST_CASE("Default environment mirrors the configuration", "[experiment]") {
    auto experiment = Experiment::from_yaml(kLinkedExperiment);
    Environment env = experiment->default_environment();
    REQUIRE(env.experiment == "linked");
    REQUIRE(env.save_path == "/tmp/expflow_test");
    REQUIRE(env.debug);
    REQUIRE(experiment->config().pipeline.size() == 3);
}

TEST_CASE("Built-in components", "[experiment][components]") {
    ComponentRegistry registry;
    REQUIRE(registry.list_components() == std::vector<std::string>{"constant", "echo"});

    ComponentCall call;
    call.stage = "s";
    call.params = {{"value", {1, 2}}};
    REQUIRE(registry.call_component("constant", call) == nlohmann::json::array({1, 2}));
    REQUIRE(registry.call_component("echo", call) == call.params);

    call.params = nlohmann::json::object();
    REQUIRE_THROWS_AS(registry.call_component("constant", call), ConfigError);
    REQUIRE_THROWS_AS(registry.call_component("nope", call), ConfigError);
}
