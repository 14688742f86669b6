// modules/runtime/local_runtime.h
#ifndef EXPFLOW_MODULES_RUNTIME_LOCAL_RUNTIME_H
#define EXPFLOW_MODULES_RUNTIME_LOCAL_RUNTIME_H

#include "modules/runtime/task_runtime.h"
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <exception>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace expflow {

struct RuntimeOptions {
    size_t workers = 0; // 0: one per hardware thread
    int cpus = 0;       // 0: same as workers
    int gpus = 0;
};

// In-process TaskRuntime backed by a worker pool.
//
// Every submitted task keeps a count of unresolved dependencies. When a task
// finishes, its dependents are decremented and the ones reaching zero move to
// the ready queue, where they wait until their CPU/GPU request fits the free
// capacity. A request larger than the whole capacity is clamped to it, so it
// runs alone instead of waiting forever. A failed task fails all of its
// transitive dependents.
//
// Records are dropped as soon as a task finishes; only failures are kept,
// until a join reports them.
class LocalTaskRuntime : public TaskRuntime {
public:
    explicit LocalTaskRuntime(RuntimeOptions options = {});
    ~LocalTaskRuntime() override;

    LocalTaskRuntime(const LocalTaskRuntime&) = delete;
    LocalTaskRuntime& operator=(const LocalTaskRuntime&) = delete;

    StageHandle submit(const StageName& stage,
                       StageTask task,
                       const std::vector<StageHandle>& dependencies,
                       const ResourceRequest& resources) override;

    void join(const std::vector<StageHandle>& handles) override;

    ResourceCapacity capacity() const override { return capacity_; }

    size_t worker_count() const { return workers_.size(); }

    // Tasks submitted but not finished yet
    size_t live_tasks() const;

    // Fails every task that has not started yet and joins the workers.
    // Running tasks are allowed to finish.
    void shutdown();

private:
    enum class TaskState : uint8_t {
        PENDING,   // waiting on dependencies
        READY,     // waiting on resources
        ADMITTED,  // resources reserved, waiting on a worker
        RUNNING,
        SUCCEEDED,
        FAILED
    };

    struct TaskRecord {
        StageHandle::Id id = 0;
        StageName stage;
        StageTask task;
        std::vector<StageHandle> dependencies;
        ResourceRequest resources;
        std::promise<StageResult> promise;
        size_t unresolved = 0;
        TaskState state = TaskState::PENDING;
        bool holds_resources = false;
        std::vector<StageHandle::Id> dependents;
    };

    // What is left of a failed task once its record is gone
    struct Failure {
        StageName stage;
        std::string error;
        uint64_t seq = 0; // 0: reported by an earlier join
    };

    void worker_loop();
    void dispatch_locked();
    void succeed_locked(TaskRecord& record, StageResult result);
    void fail_locked(TaskRecord& record, std::exception_ptr error, std::string message);
    void finish_locked(TaskRecord& record);
    void check_owned(const StageHandle& handle) const;
    std::optional<Failure> failure_of_locked(const StageHandle& handle) const;

    ResourceCapacity capacity_;
    int free_cpus_ = 0;
    int free_gpus_ = 0;

    mutable std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable done_cv_;
    std::unordered_map<StageHandle::Id, std::unique_ptr<TaskRecord>> tasks_;
    std::unordered_map<StageHandle::Id, Failure> failures_;
    std::deque<StageHandle::Id> ready_;
    std::queue<StageHandle::Id> admitted_;
    // Handle ids carry the runtime's serial in the upper 32 bits
    uint32_t serial_ = 0;
    StageHandle::Id next_id_ = 1;
    uint64_t completion_counter_ = 0;
    bool stop_ = false;

    std::vector<std::thread> workers_;
};

} // namespace expflow

#endif // EXPFLOW_MODULES_RUNTIME_LOCAL_RUNTIME_H
