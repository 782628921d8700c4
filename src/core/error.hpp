#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace digitset {

// ---------------------------------------------------------------------------
// LoadErrorKind: why a dataset load (or a read of an unloaded dataset) failed.
// ---------------------------------------------------------------------------
enum class LoadErrorKind : uint8_t {
    Fetch                 = 0,  // byte fetcher failed (I/O, missing file, bad gzip)
    MalformedHeader       = 1,  // header size not a multiple of 4, or too short
    MalformedRecordStream = 2,  // trailing bytes that do not form a whole record
    RecordCountMismatch   = 3,  // image and label counts differ within a split
    LabelOutOfRange       = 4,  // label >= num_classes
    PreconditionViolation = 5,  // e.g. get_split() before the dataset is Ready
    Cancelled             = 6,  // load was cancelled before all fetches ran
};

inline const char* load_error_kind_name(LoadErrorKind kind) noexcept {
    switch (kind) {
        case LoadErrorKind::Fetch:                 return "fetch";
        case LoadErrorKind::MalformedHeader:       return "malformed_header";
        case LoadErrorKind::MalformedRecordStream: return "malformed_record_stream";
        case LoadErrorKind::RecordCountMismatch:   return "record_count_mismatch";
        case LoadErrorKind::LabelOutOfRange:       return "label_out_of_range";
        case LoadErrorKind::PreconditionViolation: return "precondition_violation";
        case LoadErrorKind::Cancelled:             return "cancelled";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// LoadError: the single error type surfaced by decoding and by MnistDataset.
// ---------------------------------------------------------------------------
class LoadError : public std::runtime_error {
public:
    LoadError(LoadErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    LoadErrorKind kind() const noexcept { return kind_; }

private:
    LoadErrorKind kind_;
};

} // namespace digitset
