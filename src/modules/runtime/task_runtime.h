// modules/runtime/task_runtime.h
#ifndef EXPFLOW_MODULES_RUNTIME_TASK_RUNTIME_H
#define EXPFLOW_MODULES_RUNTIME_TASK_RUNTIME_H

#include "core/types/resource.h"
#include "core/types/stage.h"
#include "modules/runtime/stage_handle.h"
#include <functional>
#include <vector>

namespace expflow {

// Unit of work. Receives the resolved results of its dependencies, in the
// order the dependency handles were given to submit().
using StageTask = std::function<StageResult(const std::vector<StageResult>& inputs)>;

// Execution substrate the scheduler dispatches to.
//
// Implementations must:
//  - return from submit() without waiting for the task or its dependencies,
//  - start a task only once every dependency handle resolved successfully,
//  - fail a task whose dependency failed, without running it,
//  - make join() rethrow the first failure as StageExecutionError.
class TaskRuntime {
public:
    virtual ~TaskRuntime() = default;

    virtual StageHandle submit(const StageName& stage,
                               StageTask task,
                               const std::vector<StageHandle>& dependencies,
                               const ResourceRequest& resources) = 0;

    // Block until every handle resolved. Returns early on the first failure.
    virtual void join(const std::vector<StageHandle>& handles) = 0;

    virtual ResourceCapacity capacity() const = 0;
};

} // namespace expflow

#endif // EXPFLOW_MODULES_RUNTIME_TASK_RUNTIME_H
