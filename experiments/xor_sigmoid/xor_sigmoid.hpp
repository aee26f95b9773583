#pragma once

#include "../experiment.hpp"

#include <vector>

namespace nodal {

// ---------------------------------------------------------------------------
// XorSigmoidExperiment
//
// Topology (all hidden/output nodes are Sigmoid; "bias" is Constant 1.0):
//
//   x1, x2, bias -> h1, h2
//   h1, h2, bias -> y
//
// Learns XOR over the four binary patterns, repeated to fill `samples` rows.
// Weights start from uniform_weight_init(seed). Reports mean MSE per epoch
// and prints the pattern accuracy (y thresholded at 0.5).
// ---------------------------------------------------------------------------
class XorSigmoidExperiment : public Experiment {
public:
    explicit XorSigmoidExperiment(const ExperimentConfig& cfg);

    // Fraction of the four XOR patterns classified correctly.
    double pattern_accuracy();

protected:
    void   setup()                 override;
    double run_epoch(size_t epoch) override;

private:
    std::vector<NodeHandle> inputs_;
    NodeHandle              output_ = INVALID_NODE;
};

} // namespace nodal
