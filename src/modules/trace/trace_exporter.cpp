// modules/trace/trace_exporter.cpp
#include "modules/trace/trace_exporter.h"
#include <algorithm>

namespace expflow {

namespace {

int64_t to_millis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // namespace

TraceExporter::TraceExporter(std::string trace_id) : trace_id_(std::move(trace_id)) {}

void TraceExporter::on_stage_submitted(const StageName& stage,
                                       const std::vector<StageName>& dependencies,
                                       const ResourceRequest& resources,
                                       const nlohmann::json& algorithm,
                                       const nlohmann::json& reduction) {
    TraceRecord record;
    record.trace_id = trace_id_;
    record.stage = stage;
    record.dependencies = dependencies;
    record.resources = resources;
    record.algorithm = algorithm;
    record.reduction = reduction;
    record.status = "submitted";
    record.submit_time = std::chrono::system_clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    traces_.push_back(std::move(record));
}

void TraceExporter::set_handle_id(const StageName& stage, StageHandle::Id handle_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto* record = find_locked(stage)) {
        record->handle_id = handle_id;
    }
}

void TraceExporter::on_stage_start(const StageName& stage) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto* record = find_locked(stage)) {
        record->status = "running";
        record->start_time = std::chrono::system_clock::now();
    }
}

void TraceExporter::on_stage_end(const StageName& stage,
                                 const std::string& status,
                                 const std::optional<std::string>& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto* record = find_locked(stage)) {
        record->status = status;
        record->end_time = std::chrono::system_clock::now();
        record->error = error;
    }
}

void TraceExporter::on_stage_skipped(const StageName& stage, const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* record = find_locked(stage);
    if (record && record->status == "submitted") {
        record->status = "skipped";
        record->end_time = std::chrono::system_clock::now();
        record->error = reason;
    }
}

void TraceExporter::skip_unstarted(const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = std::chrono::system_clock::now();
    for (auto& record : traces_) {
        if (record.status == "submitted") {
            record.status = "skipped";
            record.end_time = now;
            record.error = reason;
        }
    }
}

std::vector<TraceRecord> TraceExporter::get_traces() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return traces_;
}

void TraceExporter::clear_traces() {
    std::lock_guard<std::mutex> lock(mutex_);
    traces_.clear();
}

nlohmann::json TraceExporter::to_json() const {
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json out = nlohmann::json::array();
    for (const auto& r : traces_) {
        nlohmann::json j;
        j["trace_id"] = r.trace_id;
        j["stage"] = r.stage;
        j["handle_id"] = r.handle_id;
        j["dependencies"] = r.dependencies;
        j["resources"] = expflow::to_json(r.resources);
        j["algorithm"] = r.algorithm;
        j["reduction"] = r.reduction;
        j["status"] = r.status;
        j["submit_time_ms"] = to_millis(r.submit_time);
        if (r.start_time) j["start_time_ms"] = to_millis(*r.start_time);
        if (r.end_time) j["end_time_ms"] = to_millis(*r.end_time);
        if (r.error) j["error"] = *r.error;
        out.push_back(std::move(j));
    }
    return out;
}

TraceRecord* TraceExporter::find_locked(const StageName& stage) {
    // Latest record wins if a stage name shows up in several runs
    auto it = std::find_if(traces_.rbegin(), traces_.rend(),
                           [&stage](const TraceRecord& r) { return r.stage == stage; });
    return it != traces_.rend() ? &(*it) : nullptr;
}

} // namespace expflow
