#include "experiment.hpp"

#include <filesystem>
#include <utility>

namespace nodal {

Experiment::Experiment(ExperimentConfig cfg)
    : cfg_(std::move(cfg)) {}

double Experiment::execute() {
    if (!cfg_.log_path.empty()) {
        std::filesystem::path log_dir =
            std::filesystem::path(cfg_.log_path).parent_path();
        if (!log_dir.empty())
            std::filesystem::create_directories(log_dir);

        logger_ = std::make_unique<Logger>(cfg_.log_path);
        logger_->attach();
    }

    setup();

    double metric = 0.0;
    for (size_t epoch = 0; epoch < cfg_.epochs; ++epoch) {
        emit_epoch_begin(epoch);
        metric = run_epoch(epoch);
        emit_epoch_end(epoch, metric);
    }

    if (logger_) {
        logger_->detach();
        logger_->flush();
    }
    return metric;
}

void Experiment::emit_epoch_begin(size_t epoch) {
    EpochEvent ev;
    ev.epoch = epoch;
    ev.begin = true;
    EventBus::instance().emit(ev);
}

void Experiment::emit_epoch_end(size_t epoch, double metric) {
    EpochEvent ev;
    ev.epoch        = epoch;
    ev.begin        = false;
    ev.metric_value = metric;
    EventBus::instance().emit(ev);
}

} // namespace nodal
