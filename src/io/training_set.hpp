#pragma once

#include "../core/graph.hpp"

#include <cstddef>
#include <vector>

namespace nodal {

// ---------------------------------------------------------------------------
// TrainingSet: flat input / target arrays viewed as rows.
//
// flat_inputs[r * num_inputs + i] is the value of input node i in row r;
// flat_targets is laid out the same way over the output nodes. Row access
// wraps: iteration k reads row k % num_rows().
// ---------------------------------------------------------------------------
class TrainingSet {
public:
    TrainingSet(size_t num_inputs, size_t num_outputs,
                std::vector<double> flat_inputs,
                std::vector<double> flat_targets);

    size_t num_rows()    const noexcept { return rows_; }
    size_t num_inputs()  const noexcept { return num_inputs_; }
    size_t num_outputs() const noexcept { return num_outputs_; }

    size_t row_index(size_t iteration) const noexcept { return iteration % rows_; }

    std::vector<double> inputs (size_t iteration) const;
    std::vector<double> targets(size_t iteration) const;

    // Assign row 'iteration' to the Input nodes, in order.
    void apply_inputs(Graph& graph, const std::vector<NodeHandle>& input_nodes,
                      size_t iteration) const;

private:
    size_t              num_inputs_  = 0;
    size_t              num_outputs_ = 0;
    size_t              rows_        = 0;
    std::vector<double> inputs_;
    std::vector<double> targets_;
};

} // namespace nodal
