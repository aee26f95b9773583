#include <gtest/gtest.h>

#include "src/io/logger.hpp"
#include "src/stats/event_bus.hpp"
#include "src/stats/events.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using nodal::DispatchMode;
using nodal::EventBus;

namespace {

struct PingEvent {
    int value = 0;
};

TEST(EventBus, SyncSubscribersReceiveInline) {
    auto& bus = EventBus::instance();
    std::vector<int> got;
    const nodal::SubID id = bus.subscribe<PingEvent>(
        [&got](const PingEvent& ev) { got.push_back(ev.value); }, DispatchMode::Sync);
    EXPECT_EQ(bus.subscriber_count<PingEvent>(), 1u);

    bus.emit(PingEvent{ 1 });
    bus.emit(PingEvent{ 2 });
    bus.unsubscribe(id);
    bus.emit(PingEvent{ 3 });

    EXPECT_EQ(got, (std::vector<int>{ 1, 2 }));
    EXPECT_EQ(bus.subscriber_count<PingEvent>(), 0u);
    bus.unsubscribe(id);   // unknown ids are ignored
}

TEST(EventBus, AsyncSubscribersDrainOnFlush) {
    auto& bus = EventBus::instance();
    std::atomic<int> sum{0};
    const nodal::SubID id = bus.subscribe<PingEvent>(
        [&sum](const PingEvent& ev) { sum += ev.value; }, DispatchMode::Async);

    for (int i = 1; i <= 10; ++i) bus.emit(PingEvent{ i });
    bus.flush();
    bus.unsubscribe(id);

    EXPECT_EQ(sum.load(), 55);
}

std::vector<nlohmann::json> read_jsonl(const std::string& path) {
    std::ifstream in(path);
    std::vector<nlohmann::json> out;
    std::string line;
    while (std::getline(in, line))
        if (!line.empty()) out.push_back(nlohmann::json::parse(line));
    return out;
}

TEST(Logger, WritesOneJsonObjectPerEvent) {
    const std::string path =
        (std::filesystem::temp_directory_path() / "nodal_logger_test.jsonl").string();

    auto& bus = EventBus::instance();
    {
        nodal::Logger logger(path, 2);
        logger.attach();

        bus.emit(nodal::BackwardPassEvent{ 7, 4, 1, 0 });
        bus.emit(nodal::StaleGradientEvent{ 7, "C" });
        bus.emit(nodal::WeightUpdateEvent{ 7, 3, 0.1, 0.25 });
        bus.emit(nodal::LossEvent{ 0, 1.5, 1.5 });
        nodal::EpochEvent end;
        end.epoch        = 0;
        end.begin        = false;
        end.metric_value = 1.5;
        bus.emit(end);

        logger.detach();
        EXPECT_EQ(logger.entries_written(), 5u);

        // Events after detach are not recorded.
        bus.emit(nodal::LossEvent{ 1, 9.0, 9.0 });
        bus.flush();
        EXPECT_EQ(logger.entries_written(), 5u);
    }

    const auto lines = read_jsonl(path);
    ASSERT_EQ(lines.size(), 5u);
    EXPECT_EQ(lines[0]["type"], "backward");
    EXPECT_EQ(lines[0]["iteration"], 7);
    EXPECT_EQ(lines[0]["nodes_evaluated"], 4);
    EXPECT_EQ(lines[1]["type"], "stale_gradient");
    EXPECT_EQ(lines[1]["node"], "C");
    EXPECT_EQ(lines[2]["type"], "weight_update");
    EXPECT_EQ(lines[2]["edges"], 3);
    EXPECT_EQ(lines[3]["type"], "loss");
    EXPECT_DOUBLE_EQ(lines[3]["loss"].get<double>(), 1.5);
    EXPECT_EQ(lines[4]["type"], "epoch");
    EXPECT_EQ(lines[4]["begin"], false);
    EXPECT_DOUBLE_EQ(lines[4]["metric"].get<double>(), 1.5);

    std::filesystem::remove(path);
}

TEST(Logger, UnwritablePathThrows) {
    EXPECT_THROW(nodal::Logger("/nonexistent-dir/nodal/log.jsonl"), std::runtime_error);
}

} // namespace
