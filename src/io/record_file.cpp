#include "record_file.hpp"

#include "../core/error.hpp"

#include <string>

namespace digitset {

uint32_t read_big_endian_u32(const uint8_t* p) noexcept {
    return (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) |
           (uint32_t(p[2]) <<  8) |  uint32_t(p[3]);
}

std::vector<uint32_t> parse_header(std::span<const uint8_t> bytes, size_t header_bytes) {
    if (header_bytes % 4 != 0)
        throw LoadError(LoadErrorKind::MalformedHeader,
                        "header size " + std::to_string(header_bytes) +
                        " is not a multiple of 4");
    if (header_bytes > bytes.size())
        throw LoadError(LoadErrorKind::MalformedHeader,
                        "truncated header: need " + std::to_string(header_bytes) +
                        " bytes, file has " + std::to_string(bytes.size()));

    std::vector<uint32_t> values(header_bytes / 4);
    for (size_t i = 0; i < values.size(); ++i)
        values[i] = read_big_endian_u32(bytes.data() + i * 4);
    return values;
}

RecordFile::RecordFile(std::span<const uint8_t> bytes, size_t header_bytes,
                       size_t record_bytes)
    : header_(parse_header(bytes, header_bytes))
    , payload_(bytes.subspan(header_bytes))
    , record_bytes_(record_bytes)
    , count_(0)
{
    if (record_bytes_ == 0)
        throw std::invalid_argument("RecordFile: record size must be > 0");
    if (payload_.size() % record_bytes_ != 0)
        throw LoadError(LoadErrorKind::MalformedRecordStream,
                        std::to_string(payload_.size() % record_bytes_) +
                        " trailing bytes after " +
                        std::to_string(payload_.size() / record_bytes_) +
                        " records of " + std::to_string(record_bytes_) + " bytes");
    count_ = payload_.size() / record_bytes_;
}

} // namespace digitset
