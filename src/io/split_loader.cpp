#include "split_loader.hpp"

#include "../core/error.hpp"

#include <stdexcept>
#include <utility>

namespace digitset {

SplitLoader::SplitLoader(std::shared_ptr<const MnistDataset> dataset, Split split)
    : dataset_(std::move(dataset)), split_(split) {
    if (!dataset_) throw std::invalid_argument("SplitLoader: dataset is null");
    if (dataset_->state() != DatasetState::Ready)
        throw LoadError(LoadErrorKind::PreconditionViolation,
                        std::string("SplitLoader: dataset is ") +
                        dataset_state_name(dataset_->state()));
}

size_t SplitLoader::size() const { return dataset_->size(split_); }

void SplitLoader::reset() { cursor_ = 0; }

Batch SplitLoader::next_batch(size_t batch_size) {
    if (batch_size == 0)
        throw std::invalid_argument("SplitLoader: batch_size must be > 0");

    return dataset_->get_wrapped_batch(split_, cursor_, batch_size);
}

} // namespace digitset
