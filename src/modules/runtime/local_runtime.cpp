// modules/runtime/local_runtime.cpp
#include "modules/runtime/local_runtime.h"
#include "common/logging.h"
#include "core/errors.h"
#include <algorithm>
#include <atomic>
#include <stdexcept>

namespace expflow {

namespace {

std::atomic<uint32_t> next_runtime_serial{1};

constexpr StageHandle::Id kCounterMask = 0xffffffffu;

} // namespace

LocalTaskRuntime::LocalTaskRuntime(RuntimeOptions options) {
    if (options.cpus < 0 || options.gpus < 0) {
        throw ConfigError("Runtime capacity must not be negative");
    }
    size_t workers = options.workers > 0
        ? options.workers
        : std::max<size_t>(1, std::thread::hardware_concurrency());
    capacity_.cpus = options.cpus > 0 ? options.cpus : static_cast<int>(workers);
    capacity_.gpus = options.gpus;
    free_cpus_ = capacity_.cpus;
    free_gpus_ = capacity_.gpus;
    serial_ = next_runtime_serial++;

    workers_.reserve(workers);
    for (size_t i = 0; i < workers; ++i) {
        workers_.emplace_back(&LocalTaskRuntime::worker_loop, this);
    }
    logging::logger()->debug("Local runtime started: {} workers, {} cpus, {} gpus",
                             workers, capacity_.cpus, capacity_.gpus);
}

LocalTaskRuntime::~LocalTaskRuntime() {
    shutdown();
}

StageHandle LocalTaskRuntime::submit(const StageName& stage,
                                     StageTask task,
                                     const std::vector<StageHandle>& dependencies,
                                     const ResourceRequest& resources) {
    if (!task) {
        throw std::invalid_argument("Empty task submitted for stage '" + stage + "'");
    }
    if (resources.cpus < 0 || resources.gpus < 0) {
        throw InvalidBudgetError(stage, "request of " + std::to_string(resources.cpus) + " cpus / " +
                                        std::to_string(resources.gpus) + " gpus is negative");
    }
    ResourceRequest admitted{std::min(resources.cpus, capacity_.cpus), std::min(resources.gpus, capacity_.gpus)};
    if (admitted.cpus != resources.cpus || admitted.gpus != resources.gpus) {
        logging::logger()->warn("Stage '{}' requests {} cpus / {} gpus, above the runtime capacity of "
                                "{} / {}; clamped to {} / {}",
                                stage, resources.cpus, resources.gpus, capacity_.cpus, capacity_.gpus,
                                admitted.cpus, admitted.gpus);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (stop_) {
        throw std::logic_error("submit() on a runtime that has been shut down");
    }

    // Validate every dependency before touching any state
    for (const auto& dep : dependencies) {
        check_owned(dep);
    }

    auto owned = std::make_unique<TaskRecord>();
    TaskRecord& record = *owned;
    record.id = (static_cast<StageHandle::Id>(serial_) << 32) | next_id_++;
    record.stage = stage;
    record.task = std::move(task);
    record.dependencies = dependencies;
    record.resources = admitted;
    StageHandle handle(record.id, stage, record.promise.get_future().share());

    // A dependency without a record has already finished
    std::optional<Failure> failed_dep;
    for (const auto& dep : dependencies) {
        auto it = tasks_.find(dep.id());
        if (it != tasks_.end()) {
            ++record.unresolved;
            it->second->dependents.push_back(record.id);
        } else if (!failed_dep) {
            failed_dep = failure_of_locked(dep);
        }
    }
    tasks_.emplace(record.id, std::move(owned));

    if (failed_dep) {
        std::string message = "dependency '" + failed_dep->stage + "' failed: " + failed_dep->error;
        fail_locked(record, std::make_exception_ptr(StageExecutionError(stage, message)), message);
    } else if (record.unresolved == 0) {
        record.state = TaskState::READY;
        ready_.push_back(record.id);
        dispatch_locked();
    }
    return handle;
}

void LocalTaskRuntime::join(const std::vector<StageHandle>& handles) {
    std::unique_lock<std::mutex> lock(mutex_);
    for (const auto& h : handles) {
        check_owned(h);
    }

    done_cv_.wait(lock, [this, &handles] {
        bool all_done = true;
        for (const auto& h : handles) {
            if (tasks_.count(h.id()) > 0) {
                all_done = false;
            } else if (failure_of_locked(h)) {
                return true;
            }
        }
        return all_done;
    });

    std::optional<Failure> first_failure;
    for (const auto& h : handles) {
        auto failure = failure_of_locked(h);
        if (failure && (!first_failure || failure->seq < first_failure->seq)) {
            first_failure = std::move(failure);
        }
    }
    for (const auto& h : handles) {
        failures_.erase(h.id());
    }
    if (first_failure) {
        throw StageExecutionError(first_failure->stage, first_failure->error);
    }
}

size_t LocalTaskRuntime::live_tasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

void LocalTaskRuntime::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!stop_) {
            stop_ = true;
            std::vector<StageHandle::Id> unstarted;
            for (const auto& [id, record] : tasks_) {
                auto state = record->state;
                if (state == TaskState::PENDING || state == TaskState::READY || state == TaskState::ADMITTED) {
                    unstarted.push_back(id);
                }
            }
            for (auto id : unstarted) {
                // May already be gone through a failed dependency
                auto it = tasks_.find(id);
                if (it == tasks_.end()) continue;
                TaskRecord& record = *it->second;
                std::string message = "runtime shut down before the stage started";
                fail_locked(record, std::make_exception_ptr(StageExecutionError(record.stage, message)), message);
            }
            ready_.clear();
            std::queue<StageHandle::Id>().swap(admitted_);
        }
    }
    work_cv_.notify_all();
    for (auto& w : workers_) {
        if (w.joinable()) w.join();
    }
    workers_.clear();
}

void LocalTaskRuntime::worker_loop() {
    while (true) {
        TaskRecord* record = nullptr;
        StageTask task;
        std::vector<StageHandle> dependencies;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            work_cv_.wait(lock, [this] { return stop_ || !admitted_.empty(); });
            if (admitted_.empty()) {
                return;
            }
            record = tasks_.at(admitted_.front()).get();
            admitted_.pop();
            record->state = TaskState::RUNNING;
            task = std::move(record->task);
            dependencies = record->dependencies;
        }

        logging::logger()->debug("Stage '{}' started", record->stage);
        try {
            // Dependencies have all succeeded by now, get() does not block
            std::vector<StageResult> inputs;
            inputs.reserve(dependencies.size());
            for (const auto& dep : dependencies) {
                inputs.push_back(dep.get());
            }
            StageResult result = task(inputs);
            std::lock_guard<std::mutex> lock(mutex_);
            succeed_locked(*record, std::move(result));
        } catch (const std::exception& e) {
            logging::logger()->error("Stage '{}' failed: {}", record->stage, e.what());
            std::lock_guard<std::mutex> lock(mutex_);
            fail_locked(*record, std::current_exception(), e.what());
        } catch (...) {
            logging::logger()->error("Stage '{}' failed with a non-standard exception", record->stage);
            std::lock_guard<std::mutex> lock(mutex_);
            fail_locked(*record, std::current_exception(), "unknown error");
        }
    }
}

void LocalTaskRuntime::dispatch_locked() {
    if (stop_) return;
    for (auto it = ready_.begin(); it != ready_.end();) {
        TaskRecord& record = *tasks_.at(*it);
        if (record.resources.cpus <= free_cpus_ && record.resources.gpus <= free_gpus_) {
            free_cpus_ -= record.resources.cpus;
            free_gpus_ -= record.resources.gpus;
            record.holds_resources = true;
            record.state = TaskState::ADMITTED;
            admitted_.push(record.id);
            it = ready_.erase(it);
            work_cv_.notify_one();
        } else {
            ++it;
        }
    }
}

void LocalTaskRuntime::succeed_locked(TaskRecord& record, StageResult result) {
    record.promise.set_value(std::move(result));
    record.state = TaskState::SUCCEEDED;
    finish_locked(record);
}

void LocalTaskRuntime::fail_locked(TaskRecord& record, std::exception_ptr error, std::string message) {
    record.promise.set_exception(std::move(error));
    record.state = TaskState::FAILED;
    failures_[record.id] = Failure{record.stage, std::move(message), ++completion_counter_};
    finish_locked(record);
}

void LocalTaskRuntime::finish_locked(TaskRecord& record) {
    const StageHandle::Id id = record.id;
    record.task = nullptr;
    if (record.holds_resources) {
        free_cpus_ += record.resources.cpus;
        free_gpus_ += record.resources.gpus;
        record.holds_resources = false;
    }

    std::string cascade;
    if (record.state == TaskState::FAILED) {
        cascade = "dependency '" + record.stage + "' failed: " + failures_.at(id).error;
    }
    for (auto dependent_id : record.dependents) {
        // Dependents that failed on submission are already gone
        auto it = tasks_.find(dependent_id);
        if (it == tasks_.end()) continue;
        TaskRecord& dependent = *it->second;
        if (dependent.state != TaskState::PENDING) continue;
        if (cascade.empty()) {
            if (--dependent.unresolved == 0) {
                dependent.state = TaskState::READY;
                ready_.push_back(dependent_id);
            }
        } else {
            fail_locked(dependent, std::make_exception_ptr(StageExecutionError(dependent.stage, cascade)),
                        cascade);
        }
    }

    tasks_.erase(id);
    dispatch_locked();
    done_cv_.notify_all();
}

void LocalTaskRuntime::check_owned(const StageHandle& handle) const {
    const StageHandle::Id counter = handle.id() & kCounterMask;
    if (!handle.valid() || (handle.id() >> 32) != serial_ || counter == 0 || counter >= next_id_) {
        throw std::invalid_argument("Stage handle '" + handle.stage() + "' does not belong to this runtime");
    }
}

std::optional<LocalTaskRuntime::Failure> LocalTaskRuntime::failure_of_locked(const StageHandle& handle) const {
    auto it = failures_.find(handle.id());
    if (it != failures_.end()) {
        return it->second;
    }
    // Finished earlier and already reported; the handle still holds the outcome
    try {
        handle.get();
    } catch (const StageExecutionError& e) {
        return Failure{handle.stage(), e.cause(), 0};
    } catch (const std::exception& e) {
        return Failure{handle.stage(), e.what(), 0};
    } catch (...) {
        return Failure{handle.stage(), "unknown error", 0};
    }
    return std::nullopt;
}

} // namespace expflow
