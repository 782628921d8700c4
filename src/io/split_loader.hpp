#pragma once

#include "data_source.hpp"
#include "mnist_dataset.hpp"

#include <cstddef>
#include <memory>

namespace digitset {

// ---------------------------------------------------------------------------
// SplitLoader: mini-batch iteration over one split of a loaded MnistDataset.
//
// The cursor lives here, not in the dataset, so any number of loaders can
// walk the same (read-only) dataset independently. Batches are assembled by
// MnistDataset::get_wrapped_batch() and have the same layout as get_split().
// ---------------------------------------------------------------------------
class SplitLoader : public DataSource {
public:
    // Throws LoadError{PreconditionViolation} if the dataset holds no data.
    SplitLoader(std::shared_ptr<const MnistDataset> dataset, Split split);

    Batch  next_batch(size_t batch_size) override;
    void   reset()                       override;
    size_t size()                        const override;

    Split split() const { return split_; }

private:
    std::shared_ptr<const MnistDataset> dataset_;
    Split  split_;
    size_t cursor_ = 0;
};

} // namespace digitset
