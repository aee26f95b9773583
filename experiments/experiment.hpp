#pragma once

#include "src/core/graph.hpp"
#include "src/io/logger.hpp"
#include "src/io/training_set.hpp"
#include "src/stats/event_bus.hpp"
#include "src/stats/events.hpp"
#include "src/train/trainer.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace nodal {

// Learning rate used when neither the command line nor the experiment
// supplies one.
static constexpr double kDefaultLearningRate = 0.0001;

// ---------------------------------------------------------------------------
// ExperimentConfig: shared hyperparameters passed to every experiment.
// ---------------------------------------------------------------------------
struct ExperimentConfig {
    std::string           name          = "experiment";
    size_t                epochs        = 100;
    size_t                samples       = 1000;   // synthetic rows to generate
    uint64_t              seed          = 42;     // data and weight-init seed
    std::optional<double> learning_rate;          // unset: experiment default
    std::string           log_path      = "logs/experiment.jsonl";
};

// ---------------------------------------------------------------------------
// Experiment: base class for every nodal training run.
//
// Subclasses override setup() to build the graph, the training set and the
// trainer, and run_epoch() to train for one epoch and report a metric.
// execute() wires the JSONL logger around the whole run.
//
// Example:
//   class LinearSumExperiment : public Experiment {
//     void   setup()            override { ... }
//     double run_epoch(size_t)  override { ... }
//   };
// ---------------------------------------------------------------------------
class Experiment {
public:
    explicit Experiment(ExperimentConfig cfg);
    virtual ~Experiment() = default;

    // setup() then run_epoch() for each epoch. Returns the last epoch's metric.
    double execute();

    const ExperimentConfig& config() const { return cfg_; }
    const Graph*            graph()  const { return graph_.get(); }

    Experiment(const Experiment&) = delete;
    Experiment& operator=(const Experiment&) = delete;

protected:
    virtual void   setup() = 0;
    virtual double run_epoch(size_t epoch) = 0;

    // Command-line learning rate if given, else 'fallback'.
    double learning_rate_or(double fallback = kDefaultLearningRate) const {
        return cfg_.learning_rate.value_or(fallback);
    }

    void emit_epoch_begin(size_t epoch);
    void emit_epoch_end(size_t epoch, double metric);

    ExperimentConfig             cfg_;
    std::unique_ptr<Graph>       graph_;
    std::unique_ptr<TrainingSet> data_;
    std::unique_ptr<Trainer>     trainer_;
    std::unique_ptr<Logger>      logger_;
};

} // namespace nodal
