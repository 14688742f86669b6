// modules/budget/resource_budget.h
#ifndef EXPFLOW_MODULES_BUDGET_RESOURCE_BUDGET_H
#define EXPFLOW_MODULES_BUDGET_RESOURCE_BUDGET_H

#include "core/types/resource.h"
#include "core/types/stage.h"
#include <unordered_map>

namespace expflow {

// Per-stage CPU/GPU allocation. Stages without an entry get (1 CPU, 0 GPU).
class ResourceBudgets {
public:
    static constexpr int kDefaultCpus = 1;
    static constexpr int kDefaultGpus = 0;

    void set(const StageName& stage, int cpus, int gpus);
    void set_cpus(const StageName& stage, int cpus);
    void set_gpus(const StageName& stage, int gpus);

    ResourceRequest lookup(const StageName& stage) const;
    bool contains(const StageName& stage) const;

    std::vector<StageName> stages() const;

private:
    std::unordered_map<StageName, ResourceRequest> budgets_;

    static void validate(const StageName& stage, int cpus, int gpus);
};

} // namespace expflow

#endif // EXPFLOW_MODULES_BUDGET_RESOURCE_BUDGET_H
