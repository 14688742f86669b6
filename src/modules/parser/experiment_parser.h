// modules/parser/experiment_parser.h
#ifndef EXPFLOW_MODULES_PARSER_EXPERIMENT_PARSER_H
#define EXPFLOW_MODULES_PARSER_EXPERIMENT_PARSER_H

#include "core/types/environment.h"
#include "core/types/search.h"
#include "core/types/stage.h"
#include "modules/budget/resource_budget.h"
#include "modules/runtime/local_runtime.h"
#include "modules/scheduler/experiment_scheduler.h"
#include <string>

namespace YAML {
class Node;
}

namespace expflow {

// One experiment as declared in its YAML file
struct ExperimentConfig {
    std::string name;
    std::string save_path = Environment::kDefaultSavePath;
    bool debug = false;
    SubmissionOrder order = SubmissionOrder::DECLARED;
    std::string log_level = "info";
    std::string output_template = Environment::kDefaultOutputTemplate;
    RuntimeOptions runtime;

    PipelineSpec pipeline;
    AlgorithmMap algorithms;
    ReductionMap reductions;
    ResourceBudgets budgets;
};

class ExperimentParser {
public:
    ExperimentConfig parse_from_string(const std::string& yaml_content);
    ExperimentConfig parse_from_file(const std::string& file_path);

private:
    PipelineSpec parse_pipeline(const YAML::Node& node);
    RuntimeOptions parse_runtime(const YAML::Node& node);
    void parse_algorithms(const YAML::Node& node, ExperimentConfig& config);
    void parse_reductions(const YAML::Node& node, ExperimentConfig& config);
    void parse_budgets(const YAML::Node& node, bool gpus, ExperimentConfig& config);
};

} // namespace expflow

#endif // EXPFLOW_MODULES_PARSER_EXPERIMENT_PARSER_H
