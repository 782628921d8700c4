#pragma once

#include "../core/tensor.hpp"

#include <cstddef>
#include <string>

namespace digitset {

// ---------------------------------------------------------------------------
// DatasetConfig: where the four record files live and how to decode them.
//
// Defaults describe the classic MNIST distribution (28x28 images, 10 classes,
// 16-byte image headers, 8-byte label headers, gzip-compressed files).
// ---------------------------------------------------------------------------
struct DatasetConfig {
    std::string train_images;
    std::string train_labels;
    std::string test_images;
    std::string test_labels;

    bool   decompress          = true;

    size_t image_header_bytes  = 16;
    size_t label_header_bytes  = 8;
    size_t image_height        = 28;
    size_t image_width         = 28;
    size_t num_classes         = 10;

    size_t fetch_threads       = 4;

    // Also check magic numbers, rows/cols and declared record counts.
    bool   strict_header       = false;

    // Placement and precision of produced image batches.
    Device output_device       = Device::CPU;
    DType  input_dtype         = DType::Float32;

    // JSONL diagnostics log; empty disables it.
    std::string log_path;

    size_t image_bytes() const { return image_height * image_width; }

    // Throws std::invalid_argument describing the first bad field.
    void validate() const;

    // Standard distribution file names under `dir`
    // (train-images-idx3-ubyte, ..., t10k-labels-idx1-ubyte), with a .gz
    // suffix and decompress = true when `gzipped`.
    static DatasetConfig from_directory(const std::string& dir, bool gzipped = true);
};

// Read a DatasetConfig from a JSON file. Keys mirror the field names; missing
// keys keep their defaults; "directory" (+ optional "gzipped") expands through
// from_directory() before the other keys are applied. Unknown keys, malformed
// JSON and wrongly typed values throw std::runtime_error.
DatasetConfig load_config(const std::string& path);

} // namespace digitset
