#include "logger.hpp"

#include <stdexcept>

namespace digitset {

namespace {

const char* phase_name(LoadPhase p) noexcept {
    switch (p) {
        case LoadPhase::Begin:     return "begin";
        case LoadPhase::Committed: return "committed";
        case LoadPhase::Failed:    return "failed";
    }
    return "unknown";
}

} // namespace

Logger::Logger(const std::string& path, size_t flush_every)
    : path_(path), flush_every_(flush_every == 0 ? 1 : flush_every) {
    file_.open(path, std::ios::out | std::ios::trunc);
    if (!file_)
        throw std::runtime_error("Logger: cannot open " + path);
}

Logger::~Logger() {
    detach();
    flush();
}

void Logger::attach() {
    if (sub_load_ != INVALID_SUB_ID) return;
    auto& bus = EventBus::instance();
    sub_header_  = bus.subscribe<HeaderParsedEvent>(
        [this](const HeaderParsedEvent& ev)   { on_header_parsed(ev); },
        DispatchMode::Async);
    sub_records_ = bus.subscribe<RecordsDecodedEvent>(
        [this](const RecordsDecodedEvent& ev) { on_records_decoded(ev); },
        DispatchMode::Async);
    sub_load_    = bus.subscribe<DatasetLoadEvent>(
        [this](const DatasetLoadEvent& ev)    { on_dataset_load(ev); },
        DispatchMode::Async);
}

void Logger::detach() {
    if (sub_load_ == INVALID_SUB_ID) return;
    auto& bus = EventBus::instance();
    for (SubID id : {sub_header_, sub_records_, sub_load_}) bus.unsubscribe(id);
    sub_header_  = INVALID_SUB_ID;
    sub_records_ = INVALID_SUB_ID;
    sub_load_    = INVALID_SUB_ID;
    // Handlers queued before unsubscribe still reference this logger.
    bus.flush();
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    file_.flush();
}

void Logger::write(const nlohmann::json& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    file_ << entry.dump() << '\n';
    ++write_count_;
    if (write_count_ % flush_every_ == 0) file_.flush();
}

// ---------------------------------------------------------------------------
// Event handlers
// ---------------------------------------------------------------------------
void Logger::on_header_parsed(const HeaderParsedEvent& ev) {
    nlohmann::json j;
    j["type"]    = "header";
    j["source"]  = source_kind_name(ev.kind);
    j["locator"] = ev.locator;
    j["values"]  = ev.values;
    write(j);
}

void Logger::on_records_decoded(const RecordsDecodedEvent& ev) {
    nlohmann::json j;
    j["type"]             = "records";
    j["source"]           = source_kind_name(ev.kind);
    j["locator"]          = ev.locator;
    j["decoded"]          = ev.decoded;
    j["declared"]         = ev.declared;
    j["declared_matches"] = ev.declared_matches;
    write(j);
}

void Logger::on_dataset_load(const DatasetLoadEvent& ev) {
    nlohmann::json j;
    j["type"]  = "load";
    j["phase"] = phase_name(ev.phase);
    if (ev.phase == LoadPhase::Committed) {
        j["train_size"] = ev.train_size;
        j["test_size"]  = ev.test_size;
    } else if (ev.phase == LoadPhase::Failed) {
        j["error"]   = ev.error_kind;
        j["message"] = ev.message;
    }
    write(j);
}

} // namespace digitset
