#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace digitset {

// ---------------------------------------------------------------------------
// Event types emitted on the EventBus while a dataset loads.
// All events are small, copyable value types; they may be emitted from
// ThreadPool workers as well as from the thread calling load_all().
// ---------------------------------------------------------------------------

// Which of the four record files an event refers to.
enum class SourceKind : uint8_t {
    TrainImages = 0,
    TrainLabels = 1,
    TestImages  = 2,
    TestLabels  = 3,
};

inline const char* source_kind_name(SourceKind k) noexcept {
    switch (k) {
        case SourceKind::TrainImages: return "train_images";
        case SourceKind::TrainLabels: return "train_labels";
        case SourceKind::TestImages:  return "test_images";
        case SourceKind::TestLabels:  return "test_labels";
    }
    return "unknown";
}

// Emitted after a file's header has been parsed.
struct HeaderParsedEvent {
    std::string           locator;
    SourceKind            kind = SourceKind::TrainImages;
    std::vector<uint32_t> values;   // raw big-endian header words, in order
};

// Emitted after a file's records have been decoded. `decoded` comes from the
// byte length and is authoritative; `declared` is header word 1.
struct RecordsDecodedEvent {
    std::string locator;
    SourceKind  kind             = SourceKind::TrainImages;
    size_t      decoded          = 0;
    uint32_t    declared         = 0;
    bool        declared_matches = true;
};

// Emitted at the start and end of each MnistDataset::load_all().
enum class LoadPhase : uint8_t {
    Begin     = 0,
    Committed = 1,
    Failed    = 2,
};

struct DatasetLoadEvent {
    LoadPhase   phase      = LoadPhase::Begin;
    size_t      train_size = 0;     // set on Committed
    size_t      test_size  = 0;     // set on Committed
    std::string error_kind;         // set on Failed (load_error_kind_name)
    std::string message;            // set on Failed
};

} // namespace digitset
