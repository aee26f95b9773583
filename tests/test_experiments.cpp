#include <gtest/gtest.h>

#include "experiments/linear_sum/linear_sum.hpp"
#include "experiments/xor_sigmoid/xor_sigmoid.hpp"
#include "tools/registry.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>

using nodal::ExperimentConfig;
using nodal::ExperimentRegistry;

namespace {

std::string temp_log(const std::string& name) {
    return (std::filesystem::temp_directory_path() / "nodal_tests" / name).string();
}

// Reports the learning rate it would train with, without building a graph.
class DefaultRateExperiment : public nodal::Experiment {
public:
    using Experiment::Experiment;

protected:
    void   setup() override {}
    double run_epoch(size_t) override { return learning_rate_or(); }
};

} // namespace

NODAL_REGISTER_EXPERIMENT("test_rate_first",  DefaultRateExperiment)
NODAL_REGISTER_EXPERIMENT("test_rate_second", DefaultRateExperiment)

namespace {

TEST(Experiments, LinearSumConverges) {
    ExperimentConfig cfg;
    cfg.name     = "linear_sum";
    cfg.epochs   = 30;
    cfg.samples  = 50;
    cfg.seed     = 3;
    cfg.log_path = temp_log("linear_sum.jsonl");

    nodal::LinearSumExperiment experiment(cfg);
    const double final_loss = experiment.execute();

    EXPECT_LT(final_loss, 1e-4);
    EXPECT_NEAR(experiment.weight_a(), 1.0, 1e-2);
    EXPECT_NEAR(experiment.weight_b(), 2.0, 1e-2);

    std::ifstream log(cfg.log_path);
    ASSERT_TRUE(log.good());
    std::string first;
    std::getline(log, first);
    EXPECT_FALSE(first.empty());
    std::filesystem::remove(cfg.log_path);
}

TEST(Experiments, LearningRateOverride) {
    ExperimentConfig cfg;
    cfg.epochs        = 1;
    cfg.samples       = 10;
    cfg.learning_rate = 0.0;
    cfg.log_path.clear();

    nodal::LinearSumExperiment experiment(cfg);
    experiment.execute();
    EXPECT_DOUBLE_EQ(experiment.weight_a(), 1.0);
    EXPECT_DOUBLE_EQ(experiment.weight_b(), 0.2);
}

TEST(Experiments, XorRunsAndReportsFiniteLoss) {
    ExperimentConfig cfg;
    cfg.epochs  = 3;
    cfg.samples = 400;
    cfg.seed    = 9;
    cfg.log_path.clear();

    nodal::XorSigmoidExperiment experiment(cfg);
    const double loss = experiment.execute();
    EXPECT_TRUE(std::isfinite(loss));
    EXPECT_GE(loss, 0.0);
    EXPECT_LE(loss, 1.0);

    const double acc = experiment.pattern_accuracy();
    EXPECT_GE(acc, 0.0);
    EXPECT_LE(acc, 1.0);
    ASSERT_NE(experiment.graph(), nullptr);
    EXPECT_EQ(experiment.graph()->num_edges(), 9u);
}

TEST(Experiments, AccessorsBeforeSetupThrow) {
    ExperimentConfig cfg;
    nodal::LinearSumExperiment lin(cfg);
    EXPECT_THROW(lin.weight_a(), std::runtime_error);
    nodal::XorSigmoidExperiment xr(cfg);
    EXPECT_THROW(xr.pattern_accuracy(), std::runtime_error);
}

TEST(Registry, CreatesRegisteredExperiments) {
    auto& reg = ExperimentRegistry::instance();
    if (!reg.has("test_linear_sum")) {
        reg.register_experiment("test_linear_sum", [](const ExperimentConfig& cfg) {
            return std::make_unique<nodal::LinearSumExperiment>(cfg);
        });
    }
    EXPECT_THROW(reg.register_experiment("test_linear_sum",
                                         [](const ExperimentConfig& cfg) {
                                             return std::make_unique<nodal::LinearSumExperiment>(cfg);
                                         }),
                 std::runtime_error);

    ExperimentConfig cfg;
    cfg.name = "test_linear_sum";
    EXPECT_TRUE(reg.create("test_linear_sum", cfg) != nullptr);
    EXPECT_THROW(reg.create("does_not_exist", cfg), std::runtime_error);
}

TEST(Registry, MacroRegistersSeveralExperimentsPerFile) {
    auto& reg = ExperimentRegistry::instance();
    EXPECT_TRUE(reg.has("test_rate_first"));
    EXPECT_TRUE(reg.has("test_rate_second"));

    const auto names = reg.names();
    EXPECT_TRUE(std::is_sorted(names.begin(), names.end()));

    ExperimentConfig cfg;
    cfg.epochs = 1;
    cfg.log_path.clear();
    auto experiment = reg.create("test_rate_second", cfg);
    ASSERT_TRUE(experiment != nullptr);
    EXPECT_DOUBLE_EQ(experiment->execute(), nodal::kDefaultLearningRate);
}

TEST(Experiments, LearningRateFallsBackToDefault) {
    ExperimentConfig cfg;
    cfg.epochs = 1;
    cfg.log_path.clear();

    DefaultRateExperiment unset(cfg);
    EXPECT_DOUBLE_EQ(unset.execute(), 0.0001);

    cfg.learning_rate = 0.25;
    DefaultRateExperiment overridden(cfg);
    EXPECT_DOUBLE_EQ(overridden.execute(), 0.25);
}

} // namespace
