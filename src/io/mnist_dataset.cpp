#include "mnist_dataset.hpp"

#include "file_fetcher.hpp"
#include "idx_decoder.hpp"
#include "record_file.hpp"
#include "../core/error.hpp"
#include "../core/thread_pool.hpp"
#include "../ops/one_hot.hpp"
#include "../stats/event_bus.hpp"

#include <cuda_bf16.h>
#include <cuda_fp16.h>

#include <algorithm>
#include <cstring>
#include <exception>
#include <future>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace digitset {

const char* dataset_state_name(DatasetState s) noexcept {
    switch (s) {
        case DatasetState::Empty:   return "empty";
        case DatasetState::Loading: return "loading";
        case DatasetState::Ready:   return "ready";
        case DatasetState::Failed:  return "failed";
    }
    return "unknown";
}

namespace {

bool is_image_source(SourceKind kind) {
    return kind == SourceKind::TrainImages || kind == SourceKind::TestImages;
}

void emit_failed(const LoadError& ex) {
    DatasetLoadEvent ev;
    ev.phase      = LoadPhase::Failed;
    ev.error_kind = load_error_kind_name(ex.kind());
    ev.message    = ex.what();
    EventBus::instance().emit(ev);
}

// Prefer the failure that caused the abort over the Cancelled errors it
// triggered in the remaining tasks.
std::exception_ptr first_real_failure(const std::vector<std::exception_ptr>& errors) {
    for (const auto& e : errors) {
        try {
            std::rethrow_exception(e);
        } catch (const LoadError& ex) {
            if (ex.kind() != LoadErrorKind::Cancelled) return e;
        } catch (const std::exception&) {
            return e;
        }
    }
    return errors.front();
}

} // namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------
MnistDataset::MnistDataset(DatasetConfig cfg, std::shared_ptr<ByteFetcher> fetcher)
    : cfg_(std::move(cfg)), fetcher_(std::move(fetcher)) {
    if (!fetcher_) throw std::invalid_argument("MnistDataset: fetcher is null");
    cfg_.validate();
}

MnistDataset::MnistDataset(DatasetConfig cfg)
    : MnistDataset(std::move(cfg), std::make_shared<FileFetcher>()) {}

// ---------------------------------------------------------------------------
// Loading
// ---------------------------------------------------------------------------
const std::string& MnistDataset::locator(SourceKind kind) const {
    switch (kind) {
        case SourceKind::TrainImages: return cfg_.train_images;
        case SourceKind::TrainLabels: return cfg_.train_labels;
        case SourceKind::TestImages:  return cfg_.test_images;
        case SourceKind::TestLabels:  return cfg_.test_labels;
    }
    throw std::invalid_argument("MnistDataset: unknown source kind");
}

void MnistDataset::check_header(SourceKind kind, const std::vector<uint32_t>& header,
                                size_t decoded) const {
    const std::string& loc = locator(kind);
    const bool images = is_image_source(kind);

    const uint32_t magic = images ? IDX_IMAGE_MAGIC : IDX_LABEL_MAGIC;
    if (header.empty() || header[0] != magic)
        throw LoadError(LoadErrorKind::MalformedHeader, loc + ": invalid magic number");
    if (header.size() < 2 || header[1] != decoded)
        throw LoadError(LoadErrorKind::MalformedHeader,
                        loc + ": header declares " +
                        std::to_string(header.size() > 1 ? header[1] : 0) +
                        " records, file holds " + std::to_string(decoded));
    if (images && (header.size() < 4 || header[2] != cfg_.image_height ||
                   header[3] != cfg_.image_width))
        throw LoadError(LoadErrorKind::MalformedHeader,
                        loc + ": image dimensions do not match " +
                        std::to_string(cfg_.image_height) + "x" +
                        std::to_string(cfg_.image_width));
}

MnistDataset::DecodedFile MnistDataset::fetch_and_decode(SourceKind kind) {
    const std::string& loc = locator(kind);
    try {
        if (cancel_.load())
            throw LoadError(LoadErrorKind::Cancelled, loc + ": load cancelled");

        std::vector<uint8_t> bytes;
        try {
            bytes = fetcher_->fetch(loc, cfg_.decompress);
        } catch (const std::exception& ex) {
            throw LoadError(LoadErrorKind::Fetch, ex.what());
        }

        const bool   images       = is_image_source(kind);
        const size_t header_bytes = images ? cfg_.image_header_bytes : cfg_.label_header_bytes;
        const size_t record_bytes = images ? cfg_.image_bytes() : 1;

        DecodedFile out;
        {
            // Check the header on its own first, so a truncated header is
            // reported as such even if the record stream is also broken.
            HeaderParsedEvent ev;
            ev.locator = loc;
            ev.kind    = kind;
            ev.values  = parse_header(bytes, header_bytes);
            out.header = ev.values;
            EventBus::instance().emit(ev);
        }

        RecordFile file(bytes, header_bytes, record_bytes);
        if (images) {
            out.images = decode_images(file);
        } else {
            out.labels = decode_labels(file);
            for (size_t i = 0; i < out.labels.size(); ++i) {
                if (static_cast<size_t>(out.labels[i]) >= cfg_.num_classes)
                    throw LoadError(LoadErrorKind::LabelOutOfRange,
                                    loc + ": label " + std::to_string(out.labels[i]) +
                                    " at record " + std::to_string(i) +
                                    " is outside [0, " + std::to_string(cfg_.num_classes) + ")");
            }
        }

        RecordsDecodedEvent ev;
        ev.locator          = loc;
        ev.kind             = kind;
        ev.decoded          = file.record_count();
        ev.declared         = file.declared_count();
        ev.declared_matches = ev.declared == ev.decoded;
        EventBus::instance().emit(ev);

        if (cfg_.strict_header) check_header(kind, out.header, file.record_count());
        return out;
    } catch (...) {
        // Remaining tasks skip their fetch; nothing they produce is committed.
        cancel_.store(true);
        throw;
    }
}

MnistDataset::Splits MnistDataset::fetch_all() {
    static constexpr SourceKind kinds[] = {
        SourceKind::TrainImages, SourceKind::TrainLabels,
        SourceKind::TestImages,  SourceKind::TestLabels,
    };

    std::vector<DecodedFile> files;
    {
        ThreadPool pool(cfg_.fetch_threads);
        std::vector<std::future<DecodedFile>> futures;
        for (SourceKind kind : kinds)
            futures.push_back(pool.submit([this, kind]() { return fetch_and_decode(kind); }));
        files = join_all(futures, first_real_failure);
    }
    // cancel() may arrive after every fetch has already started.
    if (cancel_.load())
        throw LoadError(LoadErrorKind::Cancelled, "load_all: load cancelled");

    Splits staged;
    for (Split split : {Split::Train, Split::Test}) {
        const size_t idx = static_cast<size_t>(split);
        SplitData& s = staged[idx];
        s.images          = std::move(files[2 * idx].images);
        s.headers.images  = std::move(files[2 * idx].header);
        s.labels          = std::move(files[2 * idx + 1].labels);
        s.headers.labels  = std::move(files[2 * idx + 1].header);

        if (s.images.size() != s.labels.size())
            throw LoadError(LoadErrorKind::RecordCountMismatch,
                            std::string(split_name(split)) + " split has " +
                            std::to_string(s.images.size()) + " images but " +
                            std::to_string(s.labels.size()) + " labels");
    }
    return staged;
}

void MnistDataset::load_all() {
    DatasetState previous = DatasetState::Empty;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (state_ == DatasetState::Loading)
            throw LoadError(LoadErrorKind::PreconditionViolation,
                            "load_all: a load is already in progress");
        previous = state_;
        state_   = DatasetState::Loading;
        cancel_.store(false);
    }
    EventBus::instance().emit(DatasetLoadEvent{});

    // Any failure puts back Ready (old data intact) or Failed (no data).
    auto restore = [this, previous]() {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        state_ = previous == DatasetState::Ready ? DatasetState::Ready
                                                 : DatasetState::Failed;
    };

    Splits staged;
    try {
        staged = fetch_all();
    } catch (const LoadError& ex) {
        restore();
        emit_failed(ex);
        throw;
    } catch (...) {
        restore();
        throw;
    }

    DatasetLoadEvent done;
    done.phase      = LoadPhase::Committed;
    done.train_size = staged[0].images.size();
    done.test_size  = staged[1].images.size();
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        splits_    = std::move(staged);
        committed_ = true;
        state_     = DatasetState::Ready;
    }
    EventBus::instance().emit(done);
}

void MnistDataset::cancel() noexcept {
    cancel_.store(true);
}

DatasetState MnistDataset::state() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return state_;
}

// ---------------------------------------------------------------------------
// Reading
// ---------------------------------------------------------------------------
const MnistDataset::SplitData& MnistDataset::committed(Split split) const {
    if (!committed_)
        throw LoadError(LoadErrorKind::PreconditionViolation,
                        std::string("dataset is ") + dataset_state_name(state_) +
                        "; call load_all() first");
    return splits_[static_cast<size_t>(split)];
}

size_t MnistDataset::size(Split split) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return committed_ ? splits_[static_cast<size_t>(split)].images.size() : 0;
}

std::vector<int32_t> MnistDataset::labels(Split split) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return committed(split).labels;
}

SplitHeaders MnistDataset::headers(Split split) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return committed(split).headers;
}

Batch MnistDataset::get_split(Split split) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const SplitData& data = committed(split);
    return assemble(data, 0, data.images.size());
}

Batch MnistDataset::get_batch(Split split, size_t start, size_t count) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const SplitData& data = committed(split);
    const size_t n = data.images.size();
    if (start > n || count > n - start)
        throw std::out_of_range("get_batch: records [" + std::to_string(start) + ", " +
                                std::to_string(start + count) + ") exceed " +
                                split_name(split) + " split of " + std::to_string(n));
    return assemble(data, start, count);
}

Batch MnistDataset::get_wrapped_batch(Split split, size_t& cursor, size_t batch_size) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const SplitData& data = committed(split);
    const size_t n = data.images.size();
    if (n == 0)
        throw std::runtime_error(std::string("MnistDataset: ") + split_name(split) +
                                 " split is empty");

    const size_t start  = cursor % n;
    const size_t actual = std::min(batch_size, n - start);
    cursor += actual;
    return assemble(data, start, actual);
}

// ---------------------------------------------------------------------------
// Assembly: one contiguous image buffer and one label buffer, in record order.
// ---------------------------------------------------------------------------
Batch MnistDataset::assemble(const SplitData& data, size_t start, size_t count) const {
    const size_t pixels = cfg_.image_bytes();

    Tensor images = Tensor::make({count, cfg_.image_height, cfg_.image_width, 1},
                                 DType::Float32, Device::CPU);
    Tensor labels = Tensor::make({count}, DType::Int32, Device::CPU);

    if (count > 0) {
        float*   img = images.host_data<float>();
        int32_t* lbl = labels.host_data<int32_t>();
        for (size_t i = 0; i < count; ++i) {
            std::memcpy(img + i * pixels, data.images[start + i].data(),
                        pixels * sizeof(float));
            lbl[i] = data.labels[start + i];
        }
    }

    Tensor targets = one_hot_encode(labels, cfg_.num_classes);
    Tensor inputs  = convert_inputs(std::move(images));

    if (cfg_.output_device == Device::CPU)
        return { std::move(inputs), std::move(targets) };
    return { inputs.to(cfg_.output_device), targets.to(cfg_.output_device) };
}

Tensor MnistDataset::convert_inputs(Tensor images) const {
    if (cfg_.input_dtype == DType::Float32) return images;

    Tensor out = Tensor::make(images.shape, cfg_.input_dtype, Device::CPU);
    const size_t n = images.numel();
    if (n == 0) return out;

    const float* src = images.host_data<float>();
    switch (cfg_.input_dtype) {
        case DType::BFloat16: {
            auto* dst = out.host_data<__nv_bfloat16>();
            for (size_t i = 0; i < n; ++i) dst[i] = __float2bfloat16(src[i]);
            break;
        }
        case DType::Float16: {
            auto* dst = out.host_data<__half>();
            for (size_t i = 0; i < n; ++i) dst[i] = __float2half(src[i]);
            break;
        }
        default:
            throw std::runtime_error(std::string("MnistDataset: unsupported input dtype ") +
                                     dtype_name(cfg_.input_dtype));
    }
    return out;
}

} // namespace digitset
