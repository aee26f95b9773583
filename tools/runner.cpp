#include "registry.hpp"

#include "experiments/linear_sum/linear_sum.hpp"
#include "experiments/xor_sigmoid/xor_sigmoid.hpp"

#include <fmt/core.h>

#include <iostream>
#include <stdexcept>
#include <string>

// ---------------------------------------------------------------------------
// Experiment registration. Registering here rather than in each experiment's
// .cpp keeps the static initialisers alive without --whole-archive.
// ---------------------------------------------------------------------------
NODAL_REGISTER_EXPERIMENT("linear_sum",  nodal::LinearSumExperiment)
NODAL_REGISTER_EXPERIMENT("xor_sigmoid", nodal::XorSigmoidExperiment)

static void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " <experiment_name> [options]\n"
              << "Options:\n"
              << "  --epochs N        Number of epochs (default: 100)\n"
              << "  --samples N       Generated training rows (default: 1000)\n"
              << "  --lr X            Learning rate (default: experiment's own, else "
              << nodal::kDefaultLearningRate << ")\n"
              << "  --seed N          Data and weight-init seed (default: 42)\n"
              << "  --log PATH        Output log file (default: logs/<name>.jsonl)\n"
              << "  --no-log          Disable the JSONL log\n"
              << "  --list            List available experiments\n";
}

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    const std::string first_arg = argv[1];

    if (first_arg == "--list") {
        std::cout << "Registered experiments:\n";
        for (const auto& name : nodal::ExperimentRegistry::instance().names())
            fmt::print("  {}\n", name);
        return 0;
    }

    if (first_arg == "--help" || first_arg == "-h") {
        print_usage(argv[0]);
        return 0;
    }

    nodal::ExperimentConfig cfg;
    cfg.name     = first_arg;
    cfg.log_path = "logs/" + first_arg + ".jsonl";

    try {
        for (int i = 2; i < argc; ++i) {
            const std::string arg = argv[i];
            if (arg == "--epochs" && i + 1 < argc) {
                cfg.epochs = std::stoull(argv[++i]);
            } else if (arg == "--samples" && i + 1 < argc) {
                cfg.samples = std::stoull(argv[++i]);
            } else if (arg == "--lr" && i + 1 < argc) {
                cfg.learning_rate = std::stod(argv[++i]);
            } else if (arg == "--seed" && i + 1 < argc) {
                cfg.seed = std::stoull(argv[++i]);
            } else if (arg == "--log" && i + 1 < argc) {
                cfg.log_path = argv[++i];
            } else if (arg == "--no-log") {
                cfg.log_path.clear();
            } else {
                std::cerr << "Unknown option: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& ex) {
        std::cerr << "Error: invalid option value (" << ex.what() << ")\n";
        return 1;
    }

    try {
        auto exp = nodal::ExperimentRegistry::instance().create(cfg.name, cfg);
        const double metric = exp->execute();
        fmt::print("{}: final loss {:.6f}\n", cfg.name, metric);
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }

    return 0;
}
