#pragma once

#include "../core/tensor.hpp"

#include <cstddef>

namespace digitset {

// ---------------------------------------------------------------------------
// one_hot_encode: expand Int32 class labels into a Float32 one-hot matrix.
//
//   labels      — [batch]              Int32,   CPU
//   num_classes — number of classes C
//   returns     — [batch, C]           Float32, CPU
//                 out[i, labels[i]] = 1.0, all other entries = 0.0
//
// Throws LoadError{LabelOutOfRange} for a label < 0 or >= C, and
// std::invalid_argument for a wrongly typed or placed input.
// ---------------------------------------------------------------------------
Tensor one_hot_encode(const Tensor& labels, size_t num_classes);

} // namespace digitset
