// modules/parser/experiment_parser.cpp
#include "modules/parser/experiment_parser.h"
#include "common/logging.h"
#include "common/utils/yaml_json.h"
#include "core/errors.h"
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

namespace expflow {

namespace {

std::string scalar_string(const YAML::Node& node, const std::string& key) {
    if (!node.IsScalar()) {
        throw ConfigError("'" + key + "' must be a string");
    }
    return node.as<std::string>();
}

bool scalar_bool(const YAML::Node& node, const std::string& key) {
    nlohmann::json value = yaml_to_json(node);
    if (!value.is_boolean()) {
        throw ConfigError("'" + key + "' must be true or false");
    }
    return value.get<bool>();
}

int scalar_int(const nlohmann::json& value, const std::string& key) {
    if (!value.is_number_integer()) {
        throw ConfigError("'" + key + "' must be an integer");
    }
    return value.get<int>();
}

// Stage-keyed sections share the same shape: a map whose keys must name pipeline stages
void require_stage_map(const YAML::Node& node, const std::string& section) {
    if (!node.IsMap()) {
        throw ConfigError("'" + section + "' must map stage names to values");
    }
}

void require_known_stage(const PipelineSpec& pipeline, const std::string& section, const StageName& stage) {
    if (!pipeline.contains(stage)) {
        throw UnknownReferenceError(section, stage);
    }
}

} // namespace

ExperimentConfig ExperimentParser::parse_from_string(const std::string& yaml_content) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_content);
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Malformed experiment YAML: ") + e.what());
    }
    if (!root.IsMap()) {
        throw ConfigError("Experiment YAML must be a mapping");
    }

    ExperimentConfig config;
    try {
        if (!root["name"]) {
            throw ConfigError("Experiment is missing 'name'");
        }
        config.name = scalar_string(root["name"], "name");
        if (config.name.empty()) {
            throw ConfigError("Experiment 'name' must not be empty");
        }

        if (root["save_path"]) config.save_path = scalar_string(root["save_path"], "save_path");
        if (root["debug"]) config.debug = scalar_bool(root["debug"], "debug");
        if (root["order"]) config.order = parse_submission_order(scalar_string(root["order"], "order"));
        if (root["log_level"]) config.log_level = scalar_string(root["log_level"], "log_level");
        if (root["output_template"]) {
            config.output_template = scalar_string(root["output_template"], "output_template");
        }
        if (root["runtime"]) config.runtime = parse_runtime(root["runtime"]);

        if (!root["pipeline"]) {
            throw ConfigError("Experiment '" + config.name + "' is missing 'pipeline'");
        }
        config.pipeline = parse_pipeline(root["pipeline"]);

        // 以下各节引用 pipeline 中的阶段名
        if (root["algorithm"]) parse_algorithms(root["algorithm"], config);
        if (root["reduce"]) parse_reductions(root["reduce"], config);
        if (root["cpus_per_trial"]) parse_budgets(root["cpus_per_trial"], false, config);
        if (root["gpus_per_trial"]) parse_budgets(root["gpus_per_trial"], true, config);
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Invalid experiment YAML: ") + e.what());
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("Invalid experiment value: ") + e.what());
    }

    logging::logger()->debug("Loaded experiment '{}' with {} stages", config.name, config.pipeline.size());
    return config;
}

ExperimentConfig ExperimentParser::parse_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigError("Cannot open file: " + file_path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_from_string(buffer.str());
}

PipelineSpec ExperimentParser::parse_pipeline(const YAML::Node& node) {
    if (!node.IsMap()) {
        throw ConfigError("'pipeline' must map stage names to stage specs");
    }
    // Iterate the YAML map directly: declaration order is significant
    PipelineSpec pipeline;
    for (const auto& entry : node) {
        StageName name = entry.first.as<std::string>();
        pipeline.add_stage(std::move(name), yaml_to_json(entry.second));
    }
    return pipeline;
}

RuntimeOptions ExperimentParser::parse_runtime(const YAML::Node& node) {
    if (!node.IsMap()) {
        throw ConfigError("'runtime' must be a mapping");
    }
    nlohmann::json j = yaml_to_json(node);
    RuntimeOptions options;
    if (j.contains("workers")) {
        int workers = scalar_int(j["workers"], "runtime.workers");
        if (workers < 0) throw ConfigError("'runtime.workers' must not be negative");
        options.workers = static_cast<size_t>(workers);
    }
    if (j.contains("cpus")) {
        options.cpus = scalar_int(j["cpus"], "runtime.cpus");
        if (options.cpus < 0) throw ConfigError("'runtime.cpus' must not be negative");
    }
    if (j.contains("gpus")) {
        options.gpus = scalar_int(j["gpus"], "runtime.gpus");
        if (options.gpus < 0) throw ConfigError("'runtime.gpus' must not be negative");
    }
    return options;
}

void ExperimentParser::parse_algorithms(const YAML::Node& node, ExperimentConfig& config) {
    require_stage_map(node, "algorithm");
    for (const auto& entry : node) {
        StageName stage = entry.first.as<std::string>();
        require_known_stage(config.pipeline, "algorithm", stage);
        config.algorithms[stage] = parse_algorithm(yaml_to_json(entry.second), stage);
    }
}

void ExperimentParser::parse_reductions(const YAML::Node& node, ExperimentConfig& config) {
    require_stage_map(node, "reduce");
    for (const auto& entry : node) {
        StageName stage = entry.first.as<std::string>();
        require_known_stage(config.pipeline, "reduce", stage);
        config.reductions[stage] = parse_reduction(yaml_to_json(entry.second), stage);
    }
}

void ExperimentParser::parse_budgets(const YAML::Node& node, bool gpus, ExperimentConfig& config) {
    const std::string section = gpus ? "gpus_per_trial" : "cpus_per_trial";
    require_stage_map(node, section);
    for (const auto& entry : node) {
        StageName stage = entry.first.as<std::string>();
        require_known_stage(config.pipeline, section, stage);
        int count = scalar_int(yaml_to_json(entry.second), section + "." + stage);
        if (gpus) {
            config.budgets.set_gpus(stage, count);
        } else {
            config.budgets.set_cpus(stage, count);
        }
    }
}

} // namespace expflow
