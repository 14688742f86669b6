// modules/runtime/runtime_session.cpp
#include "modules/runtime/runtime_session.h"
#include "common/logging.h"
#include <stdexcept>

namespace expflow {

std::shared_ptr<RuntimeSession> RuntimeSession::start(const RuntimeOptions& options, bool debug) {
    RuntimeOptions effective = options;
    if (debug) {
        effective.workers = 1;
    }
    logging::logger()->info("Starting local runtime{}", debug ? " (debug: serial execution)" : "");
    return std::make_shared<RuntimeSession>(std::make_unique<LocalTaskRuntime>(effective));
}

RuntimeSession::RuntimeSession(std::unique_ptr<TaskRuntime> runtime)
    : runtime_(std::move(runtime)) {
    if (!runtime_) {
        throw std::invalid_argument("RuntimeSession requires a runtime");
    }
}

RuntimeSession::~RuntimeSession() {
    shutdown();
}

TaskRuntime& RuntimeSession::runtime() {
    if (!runtime_) {
        throw std::logic_error("Runtime session has been shut down");
    }
    return *runtime_;
}

void RuntimeSession::shutdown() {
    if (runtime_) {
        // LocalTaskRuntime joins its workers in the destructor
        runtime_.reset();
        logging::logger()->debug("Runtime session shut down");
    }
}

} // namespace expflow
