// main.cpp
#include "common/logging.h"
#include "expflow/experiment.h"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace {

void write_trace(const expflow::Experiment& experiment) {
    namespace fs = std::filesystem;
    const auto& config = experiment.config();
    fs::path dir = fs::path(config.save_path) / config.name;
    fs::create_directories(dir);

    fs::path trace_path = dir / "trace.json";
    std::ofstream trace_file(trace_path);
    if (!trace_file.is_open()) {
        throw std::runtime_error("Cannot write trace file: " + trace_path.string());
    }
    nlohmann::json traces = experiment.trace_json();
    trace_file << traces.dump(2) << std::endl;
    expflow::logging::logger()->info("Trace exported to {} ({} records)", trace_path.string(), traces.size());
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc != 2) {
        std::cerr << "Usage: " << argv[0] << " <experiment.yaml>\n";
        return 1;
    }

    auto log = expflow::logging::logger();
    std::unique_ptr<expflow::Experiment> experiment;
    int status = 0;

    try {
        // 1. 加载实验
        experiment = expflow::Experiment::from_file(argv[1]);

        // 2. 注册自定义组件
        experiment->register_component("sum", [](const expflow::ComponentCall& call) {
            double total = 0.0;
            for (const auto& v : call.params.value("values", nlohmann::json::array())) {
                total += v.get<double>();
            }
            return nlohmann::json{{"total", total}};
        });

        // 3. 执行
        experiment->run();
        log->info("Experiment '{}' succeeded", experiment->config().name);
    } catch (const std::exception& e) {
        log->error("{}", e.what());
        status = 1;
    }

    // 4. 导出 Trace（失败时同样导出）
    if (experiment) {
        try {
            write_trace(*experiment);
        } catch (const std::exception& e) {
            log->error("{}", e.what());
            status = 1;
        }
    }
    return status;
}
