// core/errors.h
#ifndef EXPFLOW_CORE_ERRORS_H
#define EXPFLOW_CORE_ERRORS_H

#include <stdexcept>
#include <string>
#include <vector>

namespace expflow {

// 所有错误的基类
class ExpflowError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Malformed experiment configuration (bad YAML, wrong value kinds, ...)
class ConfigError : public ExpflowError {
public:
    using ExpflowError::ExpflowError;
};

// A stage (or a per-stage setting) references a stage name that does not exist.
class UnknownReferenceError : public ExpflowError {
public:
    UnknownReferenceError(std::string referencing, std::string referenced)
        : ExpflowError("'" + referencing + "' references unknown stage '" + referenced + "'"),
          referencing_(std::move(referencing)),
          referenced_(std::move(referenced)) {}

    const std::string& referencing() const { return referencing_; }
    const std::string& referenced() const { return referenced_; }

private:
    std::string referencing_;
    std::string referenced_;
};

// A stage was about to be submitted before one of its dependencies.
class UnresolvedDependencyError : public ExpflowError {
public:
    UnresolvedDependencyError(std::string stage, std::string dependency)
        : ExpflowError("Stage '" + stage + "' depends on '" + dependency +
                       "' which has not been submitted yet (pipeline order is not topological)"),
          stage_(std::move(stage)),
          dependency_(std::move(dependency)) {}

    const std::string& stage() const { return stage_; }
    const std::string& dependency() const { return dependency_; }

private:
    std::string stage_;
    std::string dependency_;
};

class InvalidBudgetError : public ExpflowError {
public:
    InvalidBudgetError(std::string stage, const std::string& reason)
        : ExpflowError("Invalid resource budget for stage '" + stage + "': " + reason),
          stage_(std::move(stage)) {}

    const std::string& stage() const { return stage_; }

private:
    std::string stage_;
};

class CycleError : public ExpflowError {
public:
    explicit CycleError(std::vector<std::string> stages)
        : ExpflowError("Pipeline contains a dependency cycle among: " + join(stages)),
          stages_(std::move(stages)) {}

    const std::vector<std::string>& stages() const { return stages_; }

private:
    std::vector<std::string> stages_;

    static std::string join(const std::vector<std::string>& names) {
        std::string out;
        for (const auto& n : names) {
            if (!out.empty()) out += ", ";
            out += n;
        }
        return out;
    }
};

// A link could not be resolved against the outputs of the stage it points to.
class LinkResolutionError : public ExpflowError {
public:
    using ExpflowError::ExpflowError;
};

// A submitted stage failed; wraps the failure the stage reported.
class StageExecutionError : public ExpflowError {
public:
    StageExecutionError(std::string stage, std::string cause)
        : ExpflowError("Stage '" + stage + "' failed: " + cause),
          stage_(std::move(stage)),
          cause_(std::move(cause)) {}

    const std::string& stage() const { return stage_; }
    const std::string& cause() const { return cause_; }

private:
    std::string stage_;
    std::string cause_;
};

} // namespace expflow

#endif // EXPFLOW_CORE_ERRORS_H
