#include "idx_decoder.hpp"

#include <stdexcept>

namespace digitset {

std::vector<std::vector<float>> decode_images(const RecordFile& file) {
    const size_t n      = file.record_count();
    const size_t pixels = file.record_bytes();

    std::vector<std::vector<float>> images(n);
    for (size_t i = 0; i < n; ++i) {
        std::span<const uint8_t> raw = file.record(i);
        images[i].resize(pixels);
        for (size_t j = 0; j < pixels; ++j)
            images[i][j] = static_cast<float>(raw[j]) / 255.0f;
    }
    return images;
}

std::vector<std::vector<float>> decode_images(std::span<const uint8_t> bytes,
                                              size_t header_bytes,
                                              size_t record_bytes) {
    return decode_images(RecordFile(bytes, header_bytes, record_bytes));
}

std::vector<int32_t> decode_labels(const RecordFile& file) {
    if (file.record_bytes() != 1)
        throw std::invalid_argument("decode_labels: label records are one byte");

    std::vector<int32_t> labels(file.record_count());
    for (size_t i = 0; i < labels.size(); ++i)
        labels[i] = static_cast<int32_t>(file.record(i)[0]);
    return labels;
}

std::vector<int32_t> decode_labels(std::span<const uint8_t> bytes, size_t header_bytes) {
    return decode_labels(RecordFile(bytes, header_bytes, 1));
}

} // namespace digitset
