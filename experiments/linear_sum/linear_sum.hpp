#pragma once

#include "../experiment.hpp"

namespace nodal {

// ---------------------------------------------------------------------------
// LinearSumExperiment
//
// Topology: Input(a), Input(b) -> Sum(s1)
//
// Learns y = a + 2b with a, b ~ Uniform[0, 5). The edge weights start at
// a = 1.0, b = 0.2 and should converge to 1 and 2. Loss is MSE.
//
// Configuration:
//   samples       - number of generated (a, b) rows
//   learning_rate - defaults to 0.01 for this experiment
// ---------------------------------------------------------------------------
class LinearSumExperiment : public Experiment {
public:
    explicit LinearSumExperiment(const ExperimentConfig& cfg);

    // Current edge weights into s1.
    double weight_a() const;
    double weight_b() const;

protected:
    void   setup()                 override;
    double run_epoch(size_t epoch) override;

private:
    NodeHandle a_   = INVALID_NODE;
    NodeHandle b_   = INVALID_NODE;
    NodeHandle sum_ = INVALID_NODE;
};

} // namespace nodal
