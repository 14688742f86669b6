// modules/runtime/runtime_session.h
#ifndef EXPFLOW_MODULES_RUNTIME_RUNTIME_SESSION_H
#define EXPFLOW_MODULES_RUNTIME_RUNTIME_SESSION_H

#include "modules/runtime/local_runtime.h"
#include "modules/runtime/task_runtime.h"
#include <memory>

namespace expflow {

// Owns the execution substrate for as long as runs need it.
//
// Created once (RuntimeSession::start) and handed to every run that should
// share it; shutdown() or destruction tears the workers down.
class RuntimeSession {
public:
    // debug: single worker, stages execute one at a time
    static std::shared_ptr<RuntimeSession> start(const RuntimeOptions& options, bool debug = false);

    explicit RuntimeSession(std::unique_ptr<TaskRuntime> runtime);
    ~RuntimeSession();

    RuntimeSession(const RuntimeSession&) = delete;
    RuntimeSession& operator=(const RuntimeSession&) = delete;

    bool active() const { return runtime_ != nullptr; }

    // Throws std::logic_error after shutdown()
    TaskRuntime& runtime();

    void shutdown();

private:
    std::unique_ptr<TaskRuntime> runtime_;
};

} // namespace expflow

#endif // EXPFLOW_MODULES_RUNTIME_RUNTIME_SESSION_H
