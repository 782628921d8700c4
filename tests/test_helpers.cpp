#include "test_helpers.hpp"

#include "src/io/record_file.hpp"

#include <zlib.h>

#include <fstream>
#include <random>
#include <sstream>
#include <stdexcept>

namespace digitset::testing {

std::vector<uint8_t> make_record_file(const std::vector<uint32_t>& header,
                                      const std::vector<uint8_t>&  payload) {
    std::vector<uint8_t> out;
    out.reserve(header.size() * 4 + payload.size());
    for (uint32_t v : header) {
        out.push_back(static_cast<uint8_t>(v >> 24));
        out.push_back(static_cast<uint8_t>(v >> 16));
        out.push_back(static_cast<uint8_t>(v >> 8));
        out.push_back(static_cast<uint8_t>(v));
    }
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

uint8_t image_pixel(size_t i, size_t j) {
    return static_cast<uint8_t>((i * 31 + j * 7) % 256);
}

std::vector<uint8_t> make_image_file(size_t n, size_t rows, size_t cols) {
    const size_t pixels = rows * cols;
    std::vector<uint8_t> payload(n * pixels);
    for (size_t i = 0; i < n; ++i)
        for (size_t j = 0; j < pixels; ++j)
            payload[i * pixels + j] = image_pixel(i, j);
    return make_record_file({IDX_IMAGE_MAGIC, static_cast<uint32_t>(n),
                             static_cast<uint32_t>(rows), static_cast<uint32_t>(cols)},
                            payload);
}

std::vector<uint8_t> make_label_file(const std::vector<uint8_t>& labels) {
    return make_record_file({IDX_LABEL_MAGIC, static_cast<uint32_t>(labels.size())}, labels);
}

DatasetConfig small_config(size_t rows, size_t cols) {
    DatasetConfig cfg;
    cfg.train_images = "mem://train-images";
    cfg.train_labels = "mem://train-labels";
    cfg.test_images  = "mem://test-images";
    cfg.test_labels  = "mem://test-labels";
    cfg.image_height = rows;
    cfg.image_width  = cols;
    return cfg;
}

void put_dataset(FakeFetcher& f, size_t train_n, size_t test_n, size_t rows, size_t cols) {
    auto labels = [](size_t n) {
        std::vector<uint8_t> l(n);
        for (size_t i = 0; i < n; ++i) l[i] = static_cast<uint8_t>(i % 10);
        return l;
    };
    f.put("mem://train-images", make_image_file(train_n, rows, cols));
    f.put("mem://train-labels", make_label_file(labels(train_n)));
    f.put("mem://test-images",  make_image_file(test_n, rows, cols));
    f.put("mem://test-labels",  make_label_file(labels(test_n)));
}

// ---------------------------------------------------------------------------
// FakeFetcher
// ---------------------------------------------------------------------------
void FakeFetcher::put(const std::string& locator, std::vector<uint8_t> bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    failing_.erase(locator);
    files_[locator] = std::move(bytes);
}

void FakeFetcher::fail(const std::string& locator) {
    std::lock_guard<std::mutex> lock(mutex_);
    failing_.insert(locator);
}

void FakeFetcher::arm_gate() {
    std::lock_guard<std::mutex> lock(mutex_);
    gate_armed_ = true;
    gate_open_  = false;
}

void FakeFetcher::wait_until_gated() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]() { return gate_waiting_; });
}

void FakeFetcher::open_gate() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        gate_open_ = true;
    }
    cv_.notify_all();
}

std::vector<uint8_t> FakeFetcher::fetch(const std::string& locator, bool decompress) {
    ++calls_;
    last_decompress_ = decompress;

    std::unique_lock<std::mutex> lock(mutex_);
    if (gate_armed_) {
        gate_armed_   = false;
        gate_waiting_ = true;
        cv_.notify_all();
        cv_.wait(lock, [this]() { return gate_open_; });
        gate_waiting_ = false;
    }
    if (failing_.count(locator)) throw FetchError(locator, "injected failure");
    auto it = files_.find(locator);
    if (it == files_.end()) throw FetchError(locator, "not registered");
    return it->second;
}

// ---------------------------------------------------------------------------
// Filesystem helpers
// ---------------------------------------------------------------------------
TempDir::TempDir() {
    std::random_device rd;
    std::ostringstream name;
    name << "digitset_test_" << std::hex << rd() << rd();
    path_ = std::filesystem::temp_directory_path() / name.str();
    std::filesystem::create_directories(path_);
}

TempDir::~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
}

void write_file(const std::string& path, const std::vector<uint8_t>& bytes) {
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f) throw std::runtime_error("write_file: cannot open " + path);
    f.write(reinterpret_cast<const char*>(bytes.data()),
            static_cast<std::streamsize>(bytes.size()));
    if (!f) throw std::runtime_error("write_file: short write " + path);
}

void write_gzip(const std::string& path, const std::vector<uint8_t>& bytes) {
    gzFile gz = gzopen(path.c_str(), "wb");
    if (!gz) throw std::runtime_error("write_gzip: cannot open " + path);
    const int n = bytes.empty()
        ? 0 : gzwrite(gz, bytes.data(), static_cast<unsigned>(bytes.size()));
    const int rc = gzclose(gz);
    if (n != static_cast<int>(bytes.size()) || rc != Z_OK)
        throw std::runtime_error("write_gzip: failed for " + path);
}

std::string read_text(const std::string& path) {
    std::ifstream f(path);
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

} // namespace digitset::testing
