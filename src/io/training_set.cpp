#include "training_set.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace nodal {

TrainingSet::TrainingSet(size_t num_inputs, size_t num_outputs,
                         std::vector<double> flat_inputs,
                         std::vector<double> flat_targets)
    : num_inputs_(num_inputs)
    , num_outputs_(num_outputs)
    , inputs_(std::move(flat_inputs))
    , targets_(std::move(flat_targets))
{
    if (num_inputs_ == 0 || num_outputs_ == 0)
        throw std::invalid_argument("TrainingSet: row widths must be > 0");
    if (inputs_.size() % num_inputs_ != 0)
        throw std::invalid_argument("TrainingSet: " + std::to_string(inputs_.size()) +
                                    " input values is not a multiple of " +
                                    std::to_string(num_inputs_));
    if (targets_.size() % num_outputs_ != 0)
        throw std::invalid_argument("TrainingSet: " + std::to_string(targets_.size()) +
                                    " target values is not a multiple of " +
                                    std::to_string(num_outputs_));

    rows_ = inputs_.size() / num_inputs_;
    if (rows_ == 0)
        throw std::invalid_argument("TrainingSet: no rows");
    if (targets_.size() / num_outputs_ != rows_)
        throw std::invalid_argument("TrainingSet: input and target row counts differ");
}

std::vector<double> TrainingSet::inputs(size_t iteration) const {
    const size_t r = row_index(iteration);
    auto first = inputs_.begin() + static_cast<std::ptrdiff_t>(r * num_inputs_);
    return { first, first + static_cast<std::ptrdiff_t>(num_inputs_) };
}

std::vector<double> TrainingSet::targets(size_t iteration) const {
    const size_t r = row_index(iteration);
    auto first = targets_.begin() + static_cast<std::ptrdiff_t>(r * num_outputs_);
    return { first, first + static_cast<std::ptrdiff_t>(num_outputs_) };
}

void TrainingSet::apply_inputs(Graph& graph, const std::vector<NodeHandle>& input_nodes,
                               size_t iteration) const {
    if (input_nodes.size() != num_inputs_)
        throw std::invalid_argument("TrainingSet::apply_inputs: expected " +
                                    std::to_string(num_inputs_) + " input nodes, got " +
                                    std::to_string(input_nodes.size()));
    const size_t base = row_index(iteration) * num_inputs_;
    for (size_t i = 0; i < num_inputs_; ++i)
        graph.set_value(input_nodes[i], inputs_[base + i]);
}

} // namespace nodal
