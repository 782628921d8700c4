#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace digitset {

// ---------------------------------------------------------------------------
// Record file format (IDX and friends):
//
//   [header: header_bytes of big-endian uint32] [record]*
//
//   images: magic(4) | n_images(4) | rows(4) | cols(4) | pixels[n*rows*cols] uint8
//   labels: magic(4) | n_labels(4) | labels[n]                               uint8
//
// Header values are positional (index 1 is the declared record count) but
// are only exposed for diagnostics: the number of records is always derived
// from the byte length of the file.
// ---------------------------------------------------------------------------
static constexpr uint32_t IDX_IMAGE_MAGIC = 0x00000803;
static constexpr uint32_t IDX_LABEL_MAGIC = 0x00000801;

uint32_t read_big_endian_u32(const uint8_t* p) noexcept;

// Decode header_bytes / 4 big-endian uint32 values from the start of bytes.
// Throws LoadError{MalformedHeader} if header_bytes is not a multiple of 4 or
// exceeds bytes.size().
std::vector<uint32_t> parse_header(std::span<const uint8_t> bytes, size_t header_bytes);

// ---------------------------------------------------------------------------
// RecordFile: non-owning view of one record file split into header + records.
//
// Construction validates the layout: the header must parse and the payload
// after it must be a whole number of records (otherwise
// LoadError{MalformedRecordStream}). The underlying bytes must outlive it.
// ---------------------------------------------------------------------------
class RecordFile {
public:
    RecordFile(std::span<const uint8_t> bytes, size_t header_bytes, size_t record_bytes);

    const std::vector<uint32_t>& header() const { return header_; }

    // Value at index 1 of the header, if present (0 otherwise).
    uint32_t declared_count() const { return header_.size() > 1 ? header_[1] : 0; }

    size_t record_count() const { return count_; }
    size_t record_bytes() const { return record_bytes_; }

    // Bytes of record i, i < record_count(). Unchecked.
    std::span<const uint8_t> record(size_t i) const {
        return payload_.subspan(i * record_bytes_, record_bytes_);
    }

private:
    std::vector<uint32_t>    header_;
    std::span<const uint8_t> payload_;
    size_t                   record_bytes_;
    size_t                   count_;
};

} // namespace digitset
