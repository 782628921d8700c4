#include "one_hot.hpp"

#include "../core/error.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>

namespace digitset {

Tensor one_hot_encode(const Tensor& labels, size_t num_classes) {
    if (labels.dtype  != DType::Int32) throw std::invalid_argument("one_hot_encode: labels must be Int32");
    if (labels.device != Device::CPU)  throw std::invalid_argument("one_hot_encode: labels must be on CPU");
    if (labels.shape.size() != 1)      throw std::invalid_argument("one_hot_encode: labels must be 1D [batch]");
    if (num_classes == 0)              throw std::invalid_argument("one_hot_encode: num_classes must be > 0");

    const size_t batch = labels.shape[0];
    Tensor out = Tensor::make({batch, num_classes}, DType::Float32, Device::CPU);
    if (batch == 0) return out;

    const int32_t* lbl = labels.host_data<int32_t>();
    float*         dst = out.host_data<float>();

    for (size_t i = 0; i < batch; ++i) {
        const int32_t c = lbl[i];
        if (c < 0 || static_cast<size_t>(c) >= num_classes)
            throw LoadError(LoadErrorKind::LabelOutOfRange,
                            "label " + std::to_string(c) + " at row " + std::to_string(i) +
                            " is outside [0, " + std::to_string(num_classes) + ")");
        // Tensor::make zero-fills; only the hot entry is written.
        dst[i * num_classes + static_cast<size_t>(c)] = 1.0f;
    }
    return out;
}

} // namespace digitset
