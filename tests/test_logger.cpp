#include "test_helpers.hpp"

#include "src/core/error.hpp"
#include "src/io/logger.hpp"
#include "src/io/mnist_dataset.hpp"
#include "src/io/record_file.hpp"
#include "src/stats/event_bus.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace digitset;
using namespace digitset::testing;

namespace {

std::vector<nlohmann::json> read_jsonl(const std::string& path) {
    std::vector<nlohmann::json> entries;
    std::istringstream in(read_text(path));
    for (std::string line; std::getline(in, line);)
        if (!line.empty()) entries.push_back(nlohmann::json::parse(line));
    return entries;
}

} // namespace

TEST(EventBus, SyncSubscriberSeesEventsUntilUnsubscribed) {
    auto& bus = EventBus::instance();
    size_t seen = 0;
    const SubID id = bus.subscribe<DatasetLoadEvent>(
        [&seen](const DatasetLoadEvent&) { ++seen; });

    bus.emit(DatasetLoadEvent{});
    bus.emit(DatasetLoadEvent{});
    bus.unsubscribe(id);
    bus.emit(DatasetLoadEvent{});
    EXPECT_EQ(seen, 2u);
}

TEST(EventBus, AsyncSubscriberRunsBeforeFlushReturns) {
    auto& bus = EventBus::instance();
    std::vector<size_t> decoded;
    const SubID id = bus.subscribe<RecordsDecodedEvent>(
        [&decoded](const RecordsDecodedEvent& ev) { decoded.push_back(ev.decoded); },
        DispatchMode::Async);

    RecordsDecodedEvent ev;
    ev.decoded = 5;
    bus.emit(ev);
    ev.decoded = 6;
    bus.emit(ev);
    bus.flush();
    bus.unsubscribe(id);
    EXPECT_EQ(decoded, (std::vector<size_t>{5, 6}));
}

TEST(Logger, WritesLoadDiagnosticsAsJsonLines) {
    TempDir dir;
    const std::string log_path = dir.file("load.jsonl");

    auto fetcher = std::make_shared<FakeFetcher>();
    put_dataset(*fetcher, 4, 2);
    fetcher->put("mem://train-labels", make_record_file({IDX_LABEL_MAGIC, 40}, {0, 1, 2, 3}));
    {
        Logger logger(log_path);
        logger.attach();
        MnistDataset ds(small_config(), fetcher);
        ds.load_all();
        logger.detach();
    }

    const auto entries = read_jsonl(log_path);
    size_t headers = 0, records = 0;
    bool saw_begin = false, saw_commit = false, saw_mismatch = false;
    for (const auto& e : entries) {
        const std::string type = e.at("type");
        if (type == "header") {
            ++headers;
            if (e.at("source") == "train_images")
                EXPECT_EQ(e.at("values"), nlohmann::json({IDX_IMAGE_MAGIC, 4, 2, 3}));
        } else if (type == "records") {
            ++records;
            if (e.at("source") == "train_labels") {
                EXPECT_EQ(e.at("decoded"), 4);
                EXPECT_EQ(e.at("declared"), 40);
                saw_mismatch = !e.at("declared_matches").get<bool>();
            }
        } else if (type == "load") {
            if (e.at("phase") == "begin") saw_begin = true;
            if (e.at("phase") == "committed") {
                saw_commit = true;
                EXPECT_EQ(e.at("train_size"), 4);
                EXPECT_EQ(e.at("test_size"), 2);
            }
        }
    }
    EXPECT_EQ(headers, 4u);
    EXPECT_EQ(records, 4u);
    EXPECT_TRUE(saw_begin);
    EXPECT_TRUE(saw_commit);
    EXPECT_TRUE(saw_mismatch);
}

TEST(Logger, RecordsFailureKind) {
    TempDir dir;
    const std::string log_path = dir.file("fail.jsonl");

    auto fetcher = std::make_shared<FakeFetcher>();
    put_dataset(*fetcher, 4, 2);
    fetcher->fail("mem://test-images");
    {
        Logger logger(log_path);
        logger.attach();
        MnistDataset ds(small_config(), fetcher);
        EXPECT_THROW(ds.load_all(), LoadError);
    }

    bool saw_failure = false;
    for (const auto& e : read_jsonl(log_path)) {
        if (e.at("type") == "load" && e.at("phase") == "failed") {
            saw_failure = true;
            EXPECT_EQ(e.at("error"), "fetch");
            EXPECT_NE(e.at("message").get<std::string>().find("test-images"), std::string::npos);
        }
    }
    EXPECT_TRUE(saw_failure);
}
