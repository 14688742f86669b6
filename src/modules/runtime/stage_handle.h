// modules/runtime/stage_handle.h
#ifndef EXPFLOW_MODULES_RUNTIME_STAGE_HANDLE_H
#define EXPFLOW_MODULES_RUNTIME_STAGE_HANDLE_H

#include "core/types/stage.h"
#include <cstdint>
#include <future>

namespace expflow {

// The result of running one stage, possibly still in flight.
//
// Returned immediately by TaskRuntime::submit and passed, unresolved, as a
// dependency input to later submissions. Copies share the same state.
class StageHandle {
public:
    using Id = uint64_t;

    StageHandle() = default;
    StageHandle(Id id, StageName stage, std::shared_future<StageResult> future);

    Id id() const { return id_; }
    const StageName& stage() const { return stage_; }

    bool valid() const { return future_.valid(); }
    bool ready() const;

    void wait() const;

    // Blocks until resolved; rethrows whatever the stage failed with
    const StageResult& get() const;

    bool operator==(const StageHandle& other) const { return id_ == other.id_; }
    bool operator!=(const StageHandle& other) const { return id_ != other.id_; }

private:
    Id id_ = 0;
    StageName stage_;
    std::shared_future<StageResult> future_;
};

} // namespace expflow

#endif // EXPFLOW_MODULES_RUNTIME_STAGE_HANDLE_H
