// tests/test_parser.cpp
#include <catch2/catch_test_macros.hpp>
#include "common/utils/links.h"
#include "core/errors.h"
#include "modules/parser/experiment_parser.h"
#include <variant>

using namespace expflow;

// Test 1: full document
TEST_CASE("Parse a complete experiment", "[parser]") {
    std::string yaml = R"(
name: mnist
save_path: /tmp/runs
debug: true
order: topological
log_level: debug
runtime: { workers: 2, cpus: 6, gpus: 1 }
pipeline:
  zeta:  { type: constant, value: { path: /data } }
  alpha: { type: echo, dataset: !link zeta.path, width: 64 }
  mid:   { type: echo, model: !@ alpha }
algorithm:
  alpha: { type: random, trials: 8, seed: 3 }
reduce:
  alpha: { k: 2, metric: acc, mode: max }
  mid: 1
cpus_per_trial: { alpha: 4 }
gpus_per_trial: { alpha: 1, mid: 1 }
)";
    ExperimentParser parser;
    ExperimentConfig config = parser.parse_from_string(yaml);

    REQUIRE(config.name == "mnist");
    REQUIRE(config.save_path == "/tmp/runs");
    REQUIRE(config.debug);
    REQUIRE(config.order == SubmissionOrder::TOPOLOGICAL);
    REQUIRE(config.log_level == "debug");
    REQUIRE(config.runtime.workers == 2);
    REQUIRE(config.runtime.cpus == 6);
    REQUIRE(config.runtime.gpus == 1);

    // YAML document order, not alphabetical
    REQUIRE(config.pipeline.names() == std::vector<StageName>{"zeta", "alpha", "mid"});
    REQUIRE(config.pipeline.at("alpha")["dataset"] == make_link("zeta.path"));
    REQUIRE(config.pipeline.at("alpha")["width"] == 64);
    REQUIRE(config.pipeline.at("mid")["model"] == make_link("alpha"));

    REQUIRE(std::get<RandomSearch>(config.algorithms.at("alpha")).trials == 8);
    REQUIRE(std::get<TopK>(config.reductions.at("alpha")).metric == "acc");
    REQUIRE(std::get<TopK>(config.reductions.at("mid")).k == 1);
    REQUIRE(config.algorithms.count("mid") == 0);

    REQUIRE(config.budgets.lookup("alpha") == ResourceRequest{4, 1});
    REQUIRE(config.budgets.lookup("mid") == ResourceRequest{1, 1});
    REQUIRE(config.budgets.lookup("zeta") == ResourceRequest{1, 0});
}

TEST_CASE("Defaults apply when keys are omitted", "[parser]") {
    ExperimentParser parser;
    ExperimentConfig config = parser.parse_from_string(R"(
name: tiny
pipeline:
  only: { type: echo }
)");
    REQUIRE(config.save_path == "expflow_output");
    REQUIRE_FALSE(config.debug);
    REQUIRE(config.order == SubmissionOrder::DECLARED);
    REQUIRE(config.log_level == "info");
    REQUIRE(config.runtime.workers == 0);
    REQUIRE(config.algorithms.empty());
    REQUIRE(config.reductions.empty());
    REQUIRE(config.budgets.stages().empty());
}

// Test 2: stage-keyed sections must name pipeline stages
TEST_CASE("Per-stage settings for unknown stages are rejected", "[parser]") {
    ExperimentParser parser;
    const std::string head = "name: e\npipeline:\n  a: { type: echo }\n";

    REQUIRE_THROWS_AS(parser.parse_from_string(head + "algorithm: { b: grid }\n"), UnknownReferenceError);
    REQUIRE_THROWS_AS(parser.parse_from_string(head + "reduce: { b: 1 }\n"), UnknownReferenceError);
    REQUIRE_THROWS_AS(parser.parse_from_string(head + "cpus_per_trial: { b: 1 }\n"), UnknownReferenceError);
    REQUIRE_THROWS_AS(parser.parse_from_string(head + "gpus_per_trial: { b: 1 }\n"), UnknownReferenceError);
}

TEST_CASE("Malformed experiments are rejected", "[parser]") {
    ExperimentParser parser;
    const std::string head = "name: e\npipeline:\n  a: { type: echo }\n";

    REQUIRE_THROWS_AS(parser.parse_from_string("name: [unclosed"), ConfigError);
    REQUIRE_THROWS_AS(parser.parse_from_string("- just\n- a list\n"), ConfigError);
    REQUIRE_THROWS_AS(parser.parse_from_string("pipeline:\n  a: { type: echo }\n"), ConfigError);
    REQUIRE_THROWS_AS(parser.parse_from_string("name: e\n"), ConfigError);
    REQUIRE_THROWS_AS(parser.parse_from_string("name: e\npipeline: [a, b]\n"), ConfigError);
    REQUIRE_THROWS_AS(parser.parse_from_string(head + "order: sideways\n"), ConfigError);
    REQUIRE_THROWS_AS(parser.parse_from_string(head + "debug: maybe\n"), ConfigError);
    REQUIRE_THROWS_AS(parser.parse_from_string(head + "algorithm: { a: annealing }\n"), ConfigError);
    REQUIRE_THROWS_AS(parser.parse_from_string(head + "reduce: { a: 0 }\n"), ConfigError);
    REQUIRE_THROWS_AS(parser.parse_from_string(head + "cpus_per_trial: { a: many }\n"), ConfigError);
    REQUIRE_THROWS_AS(parser.parse_from_string(head + "runtime: { workers: -1 }\n"), ConfigError);
    REQUIRE_THROWS_AS(parser.parse_from_file("/nonexistent/experiment.yaml"), ConfigError);
}

TEST_CASE("Negative resource counts are budget errors", "[parser][budget]") {
    ExperimentParser parser;
    REQUIRE_THROWS_AS(parser.parse_from_string("name: e\npipeline:\n  a: {}\ncpus_per_trial: { a: -2 }\n"),
                      InvalidBudgetError);
}
