#pragma once

#include "../stats/event_bus.hpp"
#include "../stats/events.hpp"

#include <nlohmann/json.hpp>
#include <fstream>
#include <mutex>
#include <string>

namespace digitset {

// ---------------------------------------------------------------------------
// Logger: subscribes to EventBus (async) and writes structured JSON lines
// to a log file, one JSON object per line (JSONL / NDJSON format).
//
// Each JSON entry has a "type" field: "header", "records" or "load".
//
// File is flushed periodically (every flush_every events) and on destruction.
// ---------------------------------------------------------------------------
class Logger {
public:
    // Opens the log file (truncating if it exists).
    explicit Logger(const std::string& path, size_t flush_every = 100);
    ~Logger();

    // Start subscribing to EventBus.
    void attach();

    // Stop subscribing and wait for handlers already queued on the bus.
    void detach();

    void flush();

    const std::string& path() const { return path_; }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    void write(const nlohmann::json& entry);

    void on_header_parsed   (const HeaderParsedEvent& ev);
    void on_records_decoded (const RecordsDecodedEvent& ev);
    void on_dataset_load    (const DatasetLoadEvent& ev);

    std::string   path_;
    std::ofstream file_;
    std::mutex    mutex_;
    size_t        flush_every_;
    size_t        write_count_ = 0;

    SubID sub_header_  = INVALID_SUB_ID;
    SubID sub_records_ = INVALID_SUB_ID;
    SubID sub_load_    = INVALID_SUB_ID;
};

} // namespace digitset
