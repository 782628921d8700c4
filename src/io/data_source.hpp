#pragma once

#include "../core/tensor.hpp"

#include <cstddef>

namespace digitset {

// ---------------------------------------------------------------------------
// Batch: a stacked set of samples.
//
//   inputs  — [N, H, W, 1]  image pixels in [0, 1]
//   targets — [N, C]        one-hot Float32 class labels
// ---------------------------------------------------------------------------
struct Batch {
    Tensor inputs;
    Tensor targets;
};

// ---------------------------------------------------------------------------
// DataSource: abstract mini-batch iterator.
//
// Implementations: SplitLoader.
// ---------------------------------------------------------------------------
class DataSource {
public:
    virtual ~DataSource() = default;

    // Return the next batch. At the end of the data the batch is cut short;
    // the following call wraps around to the beginning.
    virtual Batch next_batch(size_t batch_size) = 0;

    // Reset to the beginning of the data.
    virtual void reset() = 0;

    // Total number of samples.
    virtual size_t size() const = 0;

    // Number of batches per epoch for the given batch_size.
    size_t batches_per_epoch(size_t batch_size) const {
        return batch_size == 0 ? 0 : (size() + batch_size - 1) / batch_size;
    }
};

} // namespace digitset
