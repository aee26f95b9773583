#include <gtest/gtest.h>

#include "src/core/errors.hpp"
#include "src/core/graph.hpp"
#include "src/core/node.hpp"

#include <cmath>
#include <cstring>

using nodal::Graph;
using nodal::Node;
using nodal::NodeHandle;
using nodal::NodeKind;

namespace {

TEST(NodeForward, SumOfWeightedInputs) {
    Graph g;
    const NodeHandle a = g.create_input("a", 2.0);
    const NodeHandle b = g.create_input("b", 4.0);
    const NodeHandle s = g.create_sum("s");
    g.connect(a, s, 0.5);
    g.connect(b, s, 1.0);

    EXPECT_DOUBLE_EQ(g.activation(s), 5.0);
    EXPECT_DOUBLE_EQ(g.last_activation(s), 5.0);
}

TEST(NodeForward, SigmoidAtZeroIsHalf) {
    Graph g;
    const NodeHandle x = g.create_input("x", 0.0);
    const NodeHandle y = g.create_sigmoid("y");
    g.connect(x, y, 3.0);
    EXPECT_DOUBLE_EQ(g.activation(y), 0.5);
}

TEST(NodeForward, SigmoidSaturatesWithoutOverflow) {
    Graph g;
    const NodeHandle x = g.create_input("x", 1000.0);
    const NodeHandle y = g.create_sigmoid("y");
    g.connect(x, y, 1.0);
    EXPECT_DOUBLE_EQ(g.activation(y), 1.0);

    g.set_value(x, -1000.0);
    const double low = g.activation(y);
    EXPECT_FALSE(std::isnan(low));
    EXPECT_GE(low, 0.0);
    EXPECT_LT(low, 1e-300);
}

TEST(NodeForward, UnwiredNodes) {
    Graph g;
    const NodeHandle s = g.create_sum("s");
    const NodeHandle y = g.create_sigmoid("y");
    const NodeHandle c = g.create_constant("c", 1.5);
    EXPECT_DOUBLE_EQ(g.activation(s), 0.0);
    EXPECT_DOUBLE_EQ(g.activation(y), 0.5);
    EXPECT_DOUBLE_EQ(g.activation(c), 1.5);
}

TEST(NodeForward, RepeatedEvaluationIsBitIdentical) {
    Graph g(nodal::uniform_weight_init(11));
    const NodeHandle x1 = g.create_input("x1", 0.37);
    const NodeHandle x2 = g.create_input("x2", -1.21);
    const NodeHandle h  = g.create_sigmoid("h");
    const NodeHandle o  = g.create_sum("o");
    g.connect(x1, h);
    g.connect(x2, h);
    g.connect(h, o);
    g.connect(x1, o);

    const double first  = g.activation(o);
    const double second = g.activation(o);
    EXPECT_EQ(std::memcmp(&first, &second, sizeof(double)), 0);
}

TEST(NodeForward, SharedAncestorFeedsBothBranches) {
    Graph g;
    const NodeHandle a = g.create_input("A", 1.0);
    const NodeHandle b = g.create_sum("B");
    const NodeHandle c = g.create_sum("C");
    const NodeHandle d = g.create_sum("D");
    g.connect(a, b, 2.0);
    g.connect(a, c, 3.0);
    g.connect(b, d, 1.0);
    g.connect(c, d, 1.0);

    EXPECT_DOUBLE_EQ(g.activation(d), 5.0);
    EXPECT_DOUBLE_EQ(g.last_activation(b), 2.0);
    EXPECT_DOUBLE_EQ(g.last_activation(c), 3.0);
}

// ---------------------------------------------------------------------------
// derivative_against
// ---------------------------------------------------------------------------
TEST(NodeDerivative, SumReturnsEdgeWeight) {
    Graph g;
    const NodeHandle a = g.create_input("a", 2.0);
    const NodeHandle s = g.create_sum("s");
    g.connect(a, s, -0.75);
    g.activation(s);
    EXPECT_DOUBLE_EQ(g.derivative_against(s, "a"), -0.75);
}

TEST(NodeDerivative, SigmoidUsesCachedActivation) {
    Graph g;
    const NodeHandle a = g.create_input("a", 1.0);
    const NodeHandle y = g.create_sigmoid("y");
    g.connect(a, y, 0.8);

    const double act = g.activation(y);
    EXPECT_DOUBLE_EQ(g.derivative_against(y, "a"), act * (1.0 - act) * 0.8);
}

TEST(NodeDerivative, UnwiredInputThrows) {
    Graph g;
    const NodeHandle a = g.create_input("a");
    g.create_input("b");
    const NodeHandle s = g.create_sum("s");
    g.connect(a, s, 1.0);

    EXPECT_THROW(g.derivative_against(s, "b"), nodal::NotAnInputError);
    EXPECT_THROW(g.derivative_against(s, "missing"), nodal::NotAnInputError);
    EXPECT_THROW(g.node(s).derivative_against(s), nodal::NotAnInputError);
}

TEST(NodeDerivative, SourceNodesHaveNoInputs) {
    Graph g;
    const NodeHandle a = g.create_input("a");
    const NodeHandle c = g.create_constant("c", 1.0);
    EXPECT_THROW(g.derivative_against(a, "c"), nodal::NoInputsError);
    EXPECT_THROW(g.derivative_against(c, "a"), nodal::NoInputsError);
    EXPECT_THROW(g.node(a).derivative_against(c), nodal::NoInputsError);
}

TEST(NodeModel, SourceNodesRejectInputs) {
    Node n;
    n.id   = "in";
    n.kind = NodeKind::Input;
    EXPECT_THROW(n.add_input(3, 1.0), nodal::UnsupportedOperationError);
    n.kind = NodeKind::Constant;
    EXPECT_THROW(n.add_input(3, 1.0), nodal::UnsupportedOperationError);
    EXPECT_TRUE(n.inputs.empty());
}

TEST(NodeModel, AddInputOverwritesExistingEdge) {
    Node n;
    n.id   = "s";
    n.kind = NodeKind::Sum;
    EXPECT_TRUE(n.add_input(1, 0.5));
    EXPECT_FALSE(n.add_input(1, 2.5));
    ASSERT_EQ(n.inputs.size(), 1u);
    EXPECT_DOUBLE_EQ(n.inputs[0].weight, 2.5);
}

TEST(NodeModel, AddOutputNeverDeduplicates) {
    Node n;
    n.add_output(4);
    n.add_output(4);
    EXPECT_EQ(n.outputs.size(), 2u);
}

TEST(NodeModel, KindNames) {
    EXPECT_STREQ(nodal::kind_name(NodeKind::Input),    "input");
    EXPECT_STREQ(nodal::kind_name(NodeKind::Constant), "constant");
    EXPECT_STREQ(nodal::kind_name(NodeKind::Sum),      "sum");
    EXPECT_STREQ(nodal::kind_name(NodeKind::Sigmoid),  "sigmoid");
}

} // namespace
