// tests/test_pipeline_graph.cpp
#include <catch2/catch_test_macros.hpp>
#include "common/utils/links.h"
#include "core/errors.h"
#include "modules/graph/pipeline_graph.h"
#include <string>
#include <vector>

using namespace expflow;

namespace {

// a <- b <- d, a <- c <- d
PipelineSpec diamond() {
    PipelineSpec spec;
    spec.add_stage("a", {{"type", "constant"}, {"value", 1}});
    spec.add_stage("b", {{"type", "echo"}, {"x", make_link("a")}});
    spec.add_stage("c", {{"type", "echo"}, {"x", make_link("a.value")}});
    spec.add_stage("d", {{"type", "echo"}, {"right", make_link("c")}, {"left", make_link("b.x")}});
    return spec;
}

} // namespace

// Test 1: direct dependencies come from links, in declaration order
TEST_CASE("Dependencies follow links", "[graph]") {
    PipelineGraph graph(diamond());

    REQUIRE(graph.dependencies_of("a").empty());
    REQUIRE(graph.dependencies_of("b") == std::vector<StageName>{"a"});
    REQUIRE(graph.dependencies_of("d") == std::vector<StageName>{"b", "c"});
    REQUIRE(graph.dependents_of("a") == std::vector<StageName>{"b", "c"});
}

// Test 2: several links into the same stage yield one dependency
TEST_CASE("Repeated links are deduplicated", "[graph]") {
    PipelineSpec spec;
    spec.add_stage("data", {{"type", "constant"}, {"value", {{"x", 1}, {"y", 2}}}});
    spec.add_stage("model", {{"type", "echo"},
                             {"x", make_link("data.x")},
                             {"nested", {{"y", make_link("data.y")}}},
                             {"list", {make_link("data"), 3}}});
    PipelineGraph graph(spec);
    REQUIRE(graph.dependencies_of("model") == std::vector<StageName>{"data"});
}

// Test 3: a stage referencing its own attributes does not depend on itself
TEST_CASE("Self links are not dependencies", "[graph]") {
    PipelineSpec spec;
    spec.add_stage("a", {{"type", "echo"}});
    spec.add_stage("b", {{"type", "echo"}, {"size", 4}, {"width", make_link("b.size")}, {"in", make_link("a")}});
    PipelineGraph graph(spec);

    REQUIRE(graph.dependencies_of("b") == std::vector<StageName>{"a"});
    REQUIRE(graph.is_declared_order_topological());
}

// Test 4: links to stages outside the pipeline fail at construction
TEST_CASE("Unknown link target is rejected", "[graph]") {
    PipelineSpec spec;
    spec.add_stage("a", {{"type", "echo"}});
    spec.add_stage("b", {{"type", "echo"}, {"x", make_link("z.out")}});

    try {
        PipelineGraph graph(spec);
        FAIL("expected UnknownReferenceError");
    } catch (const UnknownReferenceError& e) {
        REQUIRE(e.referencing() == "b");
        REQUIRE(e.referenced() == "z");
    }
}

TEST_CASE("Querying an unknown stage throws", "[graph]") {
    PipelineGraph graph(diamond());
    REQUIRE_THROWS_AS(graph.dependencies_of("nope"), UnknownReferenceError);
    REQUIRE_THROWS_AS(graph.sub_pipeline("nope"), UnknownReferenceError);
}

// Test 5: sub-pipelines hold the target plus its transitive inputs
TEST_CASE("Sub pipeline is the transitive closure", "[graph]") {
    PipelineSpec spec = diamond();
    spec.add_stage("e", {{"type", "echo"}});
    PipelineGraph graph(spec);

    SubPipeline sub = graph.sub_pipeline("d");
    REQUIRE(sub.target == "d");
    REQUIRE(sub.dependencies == std::vector<StageName>{"b", "c"});
    REQUIRE(sub.stages.names() == std::vector<StageName>{"a", "b", "c", "d"});
    REQUIRE_FALSE(sub.stages.contains("e"));

    SubPipeline root = graph.sub_pipeline("a");
    REQUIRE(root.stages.names() == std::vector<StageName>{"a"});
    REQUIRE(root.dependencies.empty());
}

// Test 6: ordering
TEST_CASE("Topological order repairs out-of-order declarations", "[graph]") {
    PipelineSpec spec;
    spec.add_stage("train", {{"type", "echo"}, {"data", make_link("data")}});
    spec.add_stage("eval", {{"type", "echo"}, {"model", make_link("train")}});
    spec.add_stage("data", {{"type", "echo"}});
    spec.add_stage("other", {{"type", "echo"}});
    PipelineGraph graph(spec);

    REQUIRE_FALSE(graph.is_declared_order_topological());
    REQUIRE(graph.declared_order() == std::vector<StageName>{"train", "eval", "data", "other"});
    REQUIRE(graph.topological_order() == std::vector<StageName>{"data", "train", "eval", "other"});
}

TEST_CASE("Topological order keeps declaration order when already valid", "[graph]") {
    PipelineGraph graph(diamond());
    REQUIRE(graph.is_declared_order_topological());
    REQUIRE(graph.topological_order() == graph.declared_order());
}

TEST_CASE("Cycles are reported", "[graph]") {
    PipelineSpec spec;
    spec.add_stage("root", {{"type", "echo"}});
    spec.add_stage("x", {{"type", "echo"}, {"in", make_link("y")}});
    spec.add_stage("y", {{"type", "echo"}, {"in", make_link("x")}, {"r", make_link("root")}});
    PipelineGraph graph(spec);

    try {
        (void)graph.topological_order();
        FAIL("expected CycleError");
    } catch (const CycleError& e) {
        REQUIRE(e.stages() == std::vector<std::string>{"x", "y"});
    }
}

TEST_CASE("Pipeline spec rejects duplicate and empty names", "[graph][types]") {
    PipelineSpec spec;
    spec.add_stage("a", nlohmann::json::object());
    REQUIRE_THROWS_AS(spec.add_stage("a", nlohmann::json::object()), ConfigError);
    REQUIRE_THROWS_AS(spec.add_stage("", nlohmann::json::object()), ConfigError);
    REQUIRE_THROWS_AS(spec.at("b"), UnknownReferenceError);
    REQUIRE(spec.size() == 1);
}
