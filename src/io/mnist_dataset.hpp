#pragma once

#include "byte_fetcher.hpp"
#include "data_source.hpp"
#include "dataset_config.hpp"
#include "../stats/events.hpp"

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

namespace digitset {

enum class Split : uint8_t {
    Train = 0,
    Test  = 1,
};

inline const char* split_name(Split s) noexcept {
    return s == Split::Train ? "train" : "test";
}

// ---------------------------------------------------------------------------
// Dataset lifecycle:
//
//   Empty -> Loading -> Ready | Failed
//   Ready  -> Loading (reload) -> Ready            (new data committed)
//                              -> Ready            (failure: old data kept)
//   Failed -> Loading (retry)  -> Ready | Failed
//
// Failed exposes no data, exactly like Empty.
// ---------------------------------------------------------------------------
enum class DatasetState : uint8_t {
    Empty   = 0,
    Loading = 1,
    Ready   = 2,
    Failed  = 3,
};

const char* dataset_state_name(DatasetState s) noexcept;

// Parsed headers of one split's image and label files (diagnostics only).
struct SplitHeaders {
    std::vector<uint32_t> images;
    std::vector<uint32_t> labels;
};

// ---------------------------------------------------------------------------
// MnistDataset: loads the four record files of a labelled image dataset
// (train/test x images/labels) and assembles splits into batch tensors.
//
// load_all() fetches and decodes the four files concurrently on a ThreadPool
// and commits only if all four succeed and every split has as many labels as
// images. On failure it throws LoadError and leaves the previously committed
// data (if any) untouched.
//
// get_split() / get_batch() are read-only and safe to call from several
// threads at once, including while a reload is in progress (readers keep
// seeing the previous data until the commit).
//
// Usage:
//   MnistDataset ds(DatasetConfig::from_directory("data/mnist"));
//   ds.load_all();
//   Batch train = ds.get_split(Split::Train);   // [60000,28,28,1], [60000,10]
// ---------------------------------------------------------------------------
class MnistDataset {
public:
    MnistDataset(DatasetConfig cfg, std::shared_ptr<ByteFetcher> fetcher);

    // Reads local files through a FileFetcher.
    explicit MnistDataset(DatasetConfig cfg);

    // Throws LoadError; PreconditionViolation if a load is already running.
    void load_all();

    // Ask an in-flight load_all() to stop: fetches that have not started yet
    // are skipped and the load fails with LoadError{Cancelled} without
    // committing, even if every fetch already finished.
    void cancel() noexcept;

    DatasetState state() const;

    // Whole split as one batch: inputs [N, H, W, 1], targets [N, C].
    // Throws LoadError{PreconditionViolation} until a load has committed.
    Batch get_split(Split split) const;

    // Records [start, start + count) of a split, assembled like get_split().
    // Throws std::out_of_range if the range exceeds the split.
    Batch get_batch(Split split, size_t start, size_t count) const;

    // Up to batch_size records starting at cursor % size, stopping at the end
    // of the split; advances cursor by the number of records returned.
    // Size and records are read under one lock, so a concurrent reload that
    // shrinks the split cannot invalidate the range.
    // Throws std::runtime_error if the split is empty.
    Batch get_wrapped_batch(Split split, size_t& cursor, size_t batch_size) const;

    // 0 until a load has committed.
    size_t size(Split split) const;
    size_t train_size() const { return size(Split::Train); }
    size_t test_size()  const { return size(Split::Test); }

    // Class indices of a split, in record order.
    std::vector<int32_t> labels(Split split) const;

    SplitHeaders headers(Split split) const;

    const DatasetConfig& config() const { return cfg_; }

    MnistDataset(const MnistDataset&) = delete;
    MnistDataset& operator=(const MnistDataset&) = delete;

private:
    struct SplitData {
        std::vector<std::vector<float>> images;  // [n, H*W] float32 normalised
        std::vector<int32_t>            labels;  // [n]
        SplitHeaders                    headers;
    };

    // Result of fetching + decoding one of the four files.
    struct DecodedFile {
        std::vector<uint32_t>           header;
        std::vector<std::vector<float>> images;
        std::vector<int32_t>            labels;
    };

    using Splits = std::array<SplitData, 2>;

    const std::string& locator(SourceKind kind) const;
    DecodedFile fetch_and_decode(SourceKind kind);
    void check_header(SourceKind kind, const std::vector<uint32_t>& header,
                      size_t decoded) const;
    Splits fetch_all();

    Batch assemble(const SplitData& data, size_t start, size_t count) const;
    Tensor convert_inputs(Tensor images) const;
    const SplitData& committed(Split split) const;   // caller holds mutex_

    DatasetConfig                cfg_;
    std::shared_ptr<ByteFetcher> fetcher_;

    mutable std::shared_mutex mutex_;
    DatasetState              state_     = DatasetState::Empty;
    bool                      committed_ = false;
    Splits                    splits_;

    std::atomic<bool> cancel_{false};
};

} // namespace digitset
