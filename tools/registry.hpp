#pragma once

#include "experiments/experiment.hpp"

#include <functional>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace nodal {

using ExperimentFactory =
    std::function<std::unique_ptr<Experiment>(const ExperimentConfig&)>;

// ---------------------------------------------------------------------------
// ExperimentRegistry: experiment name -> factory.
//
// Names are unique. Lookup of an unknown name throws std::runtime_error
// with a hint to run --list. names() is sorted.
// ---------------------------------------------------------------------------
class ExperimentRegistry {
public:
    static ExperimentRegistry& instance() {
        static ExperimentRegistry registry;
        return registry;
    }

    void register_experiment(const std::string& name, ExperimentFactory factory) {
        if (!factory)
            throw std::invalid_argument("Experiment '" + name + "' has no factory");
        if (!factories_.emplace(name, std::move(factory)).second)
            throw std::runtime_error("Duplicate experiment name: " + name);
    }

    std::unique_ptr<Experiment> create(const std::string& name,
                                       const ExperimentConfig& cfg) const {
        const auto it = factories_.find(name);
        if (it == factories_.end())
            throw std::runtime_error("Unknown experiment: " + name +
                                     ". Run with --list to see registered experiments.");
        return it->second(cfg);
    }

    bool has(const std::string& name) const { return factories_.count(name) != 0; }

    std::vector<std::string> names() const {
        std::vector<std::string> out;
        out.reserve(factories_.size());
        for (const auto& entry : factories_) out.push_back(entry.first);
        return out;
    }

private:
    ExperimentRegistry() = default;

    std::map<std::string, ExperimentFactory> factories_;
};

// Registers ExperimentT under 'name' when constructed. ExperimentT must be
// constructible from (const ExperimentConfig&).
template<typename ExperimentT>
struct ExperimentRegistrar {
    explicit ExperimentRegistrar(const char* name) {
        ExperimentRegistry::instance().register_experiment(
            name, [](const ExperimentConfig& cfg) -> std::unique_ptr<Experiment> {
                return std::make_unique<ExperimentT>(cfg);
            });
    }
};

} // namespace nodal

// ---------------------------------------------------------------------------
// NODAL_REGISTER_EXPERIMENT(name, ExperimentClass)
//
// May appear any number of times in one translation unit; each use gets its
// own registrar object.
//
//   NODAL_REGISTER_EXPERIMENT("linear_sum", nodal::LinearSumExperiment)
// ---------------------------------------------------------------------------
#define NODAL_CONCAT_(a, b) a##b
#define NODAL_CONCAT(a, b)  NODAL_CONCAT_(a, b)

#define NODAL_REGISTER_EXPERIMENT(name, ExperimentClass)                      \
    static const nodal::ExperimentRegistrar<ExperimentClass>                  \
        NODAL_CONCAT(nodal_experiment_registrar_, __COUNTER__){ name };
