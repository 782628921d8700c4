#include "test_helpers.hpp"

#include "src/core/error.hpp"
#include "src/io/split_loader.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <cstring>
#include <memory>
#include <thread>

using namespace digitset;
using namespace digitset::testing;

namespace {

std::shared_ptr<MnistDataset> loaded_dataset(size_t train_n, size_t test_n) {
    auto fetcher = std::make_shared<FakeFetcher>();
    put_dataset(*fetcher, train_n, test_n);
    auto ds = std::make_shared<MnistDataset>(small_config(), fetcher);
    ds->load_all();
    return ds;
}

} // namespace

TEST(SplitLoader, RequiresReadyDataset) {
    auto ds = std::make_shared<MnistDataset>(small_config(), std::make_shared<FakeFetcher>());
    try {
        SplitLoader loader(ds, Split::Train);
        FAIL() << "expected LoadError";
    } catch (const LoadError& ex) {
        EXPECT_EQ(ex.kind(), LoadErrorKind::PreconditionViolation);
    }
}

TEST(SplitLoader, WalksSplitInBatchesWithShortTail) {
    auto ds = loaded_dataset(10, 3);
    SplitLoader loader(ds, Split::Train);
    EXPECT_EQ(loader.size(), 10u);
    EXPECT_EQ(loader.batches_per_epoch(4), 3u);

    EXPECT_EQ(loader.next_batch(4).inputs.shape[0], 4u);
    EXPECT_EQ(loader.next_batch(4).inputs.shape[0], 4u);
    const Batch tail = loader.next_batch(4);
    EXPECT_EQ(tail.inputs.shape,  (std::vector<size_t>{2, 2, 3, 1}));
    EXPECT_EQ(tail.targets.shape, (std::vector<size_t>{2, 10}));

    // Wraps around to record 0.
    const Batch again = loader.next_batch(4);
    const Batch first = ds->get_batch(Split::Train, 0, 4);
    EXPECT_EQ(std::memcmp(again.inputs.data, first.inputs.data, first.inputs.nbytes()), 0);
}

TEST(SplitLoader, ResetRestartsFromFirstRecord) {
    auto ds = loaded_dataset(6, 6);
    SplitLoader loader(ds, Split::Test);
    loader.next_batch(5);
    loader.reset();
    const Batch b = loader.next_batch(2);
    const Batch expected = ds->get_batch(Split::Test, 0, 2);
    EXPECT_EQ(std::memcmp(b.targets.data, expected.targets.data, expected.targets.nbytes()), 0);
}

TEST(SplitLoader, IndependentCursors) {
    auto ds = loaded_dataset(8, 2);
    SplitLoader a(ds, Split::Train);
    SplitLoader b(ds, Split::Train);
    a.next_batch(3);
    const Batch from_b = b.next_batch(3);
    const Batch first  = ds->get_batch(Split::Train, 0, 3);
    EXPECT_EQ(std::memcmp(from_b.inputs.data, first.inputs.data, first.inputs.nbytes()), 0);
}

TEST(SplitLoader, RejectsZeroBatchAndEmptySplit) {
    auto ds = loaded_dataset(4, 0);
    SplitLoader train(ds, Split::Train);
    EXPECT_THROW(train.next_batch(0), std::invalid_argument);
    SplitLoader test(ds, Split::Test);
    EXPECT_THROW(test.next_batch(1), std::runtime_error);
    EXPECT_EQ(test.batches_per_epoch(8), 0u);
}

TEST(SplitLoader, ReloadToSmallerSplitWhileIterating) {
    auto fetcher = std::make_shared<FakeFetcher>();
    put_dataset(*fetcher, 50, 2);
    auto ds = std::make_shared<MnistDataset>(small_config(), fetcher);
    ds->load_all();
    SplitLoader loader(ds, Split::Train);

    std::atomic<bool> stop{false};
    std::thread reloader([&]() {
        for (size_t k = 0; !stop.load(); ++k) {
            put_dataset(*fetcher, k % 2 == 0 ? 3 : 50, 2);
            ds->load_all();
        }
    });

    size_t bad = 0;
    for (int i = 0; i < 20000; ++i) {
        const Batch b = loader.next_batch(7);
        const size_t rows = b.inputs.shape[0];
        if (rows == 0 || rows > 7 || b.targets.shape[0] != rows) ++bad;
    }
    stop.store(true);
    reloader.join();
    EXPECT_EQ(bad, 0u);
}
