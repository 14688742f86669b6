// modules/budget/resource_budget.cpp
#include "modules/budget/resource_budget.h"
#include "core/errors.h"
#include <string>

namespace expflow {

void ResourceBudgets::validate(const StageName& stage, int cpus, int gpus) {
    if (cpus < 0) {
        throw InvalidBudgetError(stage, "cpus must not be negative (got " + std::to_string(cpus) + ")");
    }
    if (gpus < 0) {
        throw InvalidBudgetError(stage, "gpus must not be negative (got " + std::to_string(gpus) + ")");
    }
}

void ResourceBudgets::set(const StageName& stage, int cpus, int gpus) {
    validate(stage, cpus, gpus);
    budgets_[stage] = ResourceRequest{cpus, gpus};
}

void ResourceBudgets::set_cpus(const StageName& stage, int cpus) {
    validate(stage, cpus, 0);
    auto [it, _] = budgets_.try_emplace(stage, ResourceRequest{kDefaultCpus, kDefaultGpus});
    it->second.cpus = cpus;
}

void ResourceBudgets::set_gpus(const StageName& stage, int gpus) {
    validate(stage, 0, gpus);
    auto [it, _] = budgets_.try_emplace(stage, ResourceRequest{kDefaultCpus, kDefaultGpus});
    it->second.gpus = gpus;
}

ResourceRequest ResourceBudgets::lookup(const StageName& stage) const {
    auto it = budgets_.find(stage);
    if (it == budgets_.end()) {
        return ResourceRequest{kDefaultCpus, kDefaultGpus};
    }
    return it->second;
}

bool ResourceBudgets::contains(const StageName& stage) const {
    return budgets_.find(stage) != budgets_.end();
}

std::vector<StageName> ResourceBudgets::stages() const {
    std::vector<StageName> names;
    names.reserve(budgets_.size());
    for (const auto& [name, _] : budgets_) {
        names.push_back(name);
    }
    return names;
}

} // namespace expflow
