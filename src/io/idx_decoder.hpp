#pragma once

#include "record_file.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace digitset {

// ---------------------------------------------------------------------------
// Record decoders.
//
// Images: every record is record_bytes uint8 pixels, normalised to [0, 1]
// float32 by dividing by 255. Labels: every record is one uint8 class index.
// Records are returned in file order; that order is the record index used to
// pair images with labels.
//
// Errors (LoadError): MalformedHeader, MalformedRecordStream. A trailing
// partial record is never read or padded.
// ---------------------------------------------------------------------------
std::vector<std::vector<float>> decode_images(const RecordFile& file);
std::vector<std::vector<float>> decode_images(std::span<const uint8_t> bytes,
                                              size_t header_bytes,
                                              size_t record_bytes);

std::vector<int32_t> decode_labels(const RecordFile& file);
std::vector<int32_t> decode_labels(std::span<const uint8_t> bytes, size_t header_bytes);

} // namespace digitset
