#include "test_helpers.hpp"

#include "src/io/file_fetcher.hpp"
#include "src/io/mnist_dataset.hpp"

#include <gtest/gtest.h>

using namespace digitset;
using namespace digitset::testing;

TEST(FileFetcher, ReadsPlainFileVerbatim) {
    TempDir dir;
    const auto bytes = make_label_file({1, 2, 3});
    write_file(dir.file("labels"), bytes);

    FileFetcher f;
    EXPECT_EQ(f.fetch(dir.file("labels"), false), bytes);
}

TEST(FileFetcher, DecompressesGzip) {
    TempDir dir;
    const auto bytes = make_image_file(200);   // > one zlib read chunk
    write_gzip(dir.file("images.gz"), bytes);

    FileFetcher f;
    EXPECT_EQ(f.fetch(dir.file("images.gz"), true), bytes);
}

TEST(FileFetcher, GzipReaderPassesPlainFilesThrough) {
    TempDir dir;
    const auto bytes = make_label_file({9, 8});
    write_file(dir.file("labels"), bytes);

    FileFetcher f;
    EXPECT_EQ(f.fetch(dir.file("labels"), true), bytes);
}

TEST(FileFetcher, ResolvesRelativeLocatorsAgainstRoot) {
    TempDir dir;
    write_file(dir.file("a.bin"), {1, 2, 3});
    FileFetcher f(dir.path().string());
    EXPECT_EQ(f.fetch("a.bin", false), (std::vector<uint8_t>{1, 2, 3}));
}

TEST(FileFetcher, MissingFileIsFetchError) {
    TempDir dir;
    FileFetcher f;
    try {
        f.fetch(dir.file("nope.gz"), true);
        FAIL() << "expected FetchError";
    } catch (const FetchError& ex) {
        EXPECT_EQ(ex.locator(), dir.file("nope.gz"));
    }
}

TEST(FileFetcher, LoadsDatasetFromStandardFileNames) {
    TempDir dir;
    std::vector<uint8_t> train_labels(12), test_labels(5);
    for (size_t i = 0; i < train_labels.size(); ++i) train_labels[i] = static_cast<uint8_t>(i % 10);
    for (size_t i = 0; i < test_labels.size(); ++i)  test_labels[i]  = static_cast<uint8_t>(9 - i);

    write_gzip(dir.file("train-images-idx3-ubyte.gz"), make_image_file(12));
    write_gzip(dir.file("train-labels-idx1-ubyte.gz"), make_label_file(train_labels));
    write_gzip(dir.file("t10k-images-idx3-ubyte.gz"),  make_image_file(5));
    write_gzip(dir.file("t10k-labels-idx1-ubyte.gz"),  make_label_file(test_labels));

    DatasetConfig cfg = DatasetConfig::from_directory(dir.path().string());
    cfg.strict_header = true;
    MnistDataset ds(cfg);
    ds.load_all();

    EXPECT_EQ(ds.train_size(), 12u);
    EXPECT_EQ(ds.test_size(), 5u);
    const Batch b = ds.get_split(Split::Test);
    EXPECT_EQ(b.inputs.shape,  (std::vector<size_t>{5, 28, 28, 1}));
    EXPECT_EQ(b.targets.shape, (std::vector<size_t>{5, 10}));
    EXPECT_EQ(b.targets.host_data<float>()[0 * 10 + 9], 1.0f);
    EXPECT_EQ(b.targets.host_data<float>()[4 * 10 + 5], 1.0f);
}
