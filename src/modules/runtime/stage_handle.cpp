// modules/runtime/stage_handle.cpp
#include "modules/runtime/stage_handle.h"
#include <chrono>
#include <stdexcept>

namespace expflow {

StageHandle::StageHandle(Id id, StageName stage, std::shared_future<StageResult> future)
    : id_(id), stage_(std::move(stage)), future_(std::move(future)) {}

bool StageHandle::ready() const {
    if (!valid()) return false;
    return future_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

void StageHandle::wait() const {
    if (!valid()) {
        throw std::logic_error("wait() on an empty stage handle");
    }
    future_.wait();
}

const StageResult& StageHandle::get() const {
    if (!valid()) {
        throw std::logic_error("get() on an empty stage handle");
    }
    return future_.get();
}

} // namespace expflow
