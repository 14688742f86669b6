// modules/trace/trace_exporter.h
#ifndef EXPFLOW_MODULES_TRACE_TRACE_EXPORTER_H
#define EXPFLOW_MODULES_TRACE_TRACE_EXPORTER_H

#include "core/types/resource.h"
#include "core/types/stage.h"
#include "modules/runtime/stage_handle.h"
#include <chrono>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace expflow {

struct TraceRecord {
    std::string trace_id;
    StageName stage;
    StageHandle::Id handle_id = 0;
    std::vector<StageName> dependencies;
    ResourceRequest resources;
    nlohmann::json algorithm;
    nlohmann::json reduction;
    std::string status; // "submitted", "running", "success", "failed", "skipped"
    std::chrono::system_clock::time_point submit_time;
    std::optional<std::chrono::system_clock::time_point> start_time;
    std::optional<std::chrono::system_clock::time_point> end_time;
    std::optional<std::string> error;
};

// Per-stage lifecycle records of one run. Updated from worker threads.
class TraceExporter {
public:
    explicit TraceExporter(std::string trace_id = "t-default");

    void on_stage_submitted(const StageName& stage,
                            const std::vector<StageName>& dependencies,
                            const ResourceRequest& resources,
                            const nlohmann::json& algorithm,
                            const nlohmann::json& reduction);

    void set_handle_id(const StageName& stage, StageHandle::Id handle_id);

    void on_stage_start(const StageName& stage);

    void on_stage_end(const StageName& stage,
                      const std::string& status,
                      const std::optional<std::string>& error = std::nullopt);

    // Marks a stage that failed without ever starting (a dependency failed)
    void on_stage_skipped(const StageName& stage, const std::string& reason);

    // Marks every stage still waiting to start as skipped
    void skip_unstarted(const std::string& reason);

    std::vector<TraceRecord> get_traces() const;
    void clear_traces();

    nlohmann::json to_json() const;

private:
    std::string trace_id_;
    mutable std::mutex mutex_;
    std::vector<TraceRecord> traces_;

    TraceRecord* find_locked(const StageName& stage);
};

} // namespace expflow

#endif // EXPFLOW_MODULES_TRACE_TRACE_EXPORTER_H
