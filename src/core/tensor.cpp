#include "tensor.hpp"

#include <cstring>
#include <stdexcept>
#include <utility>

#include <cuda_runtime.h>

namespace digitset {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------
std::vector<size_t> c_order_strides(const std::vector<size_t>& shape) {
    const int ndim = static_cast<int>(shape.size());
    std::vector<size_t> strides(ndim, 1);
    for (int i = ndim - 2; i >= 0; --i) {
        strides[i] = strides[i + 1] * shape[i + 1];
    }
    return strides;
}

std::string shape_string(const std::vector<size_t>& shape) {
    std::string s = "[";
    for (size_t i = 0; i < shape.size(); ++i) {
        if (i) s += ", ";
        s += std::to_string(shape[i]);
    }
    return s + "]";
}

DType parse_dtype(const std::string& name) {
    for (DType dt : {DType::Float32, DType::Float16, DType::BFloat16,
                     DType::Int32, DType::Int64}) {
        if (name == dtype_name(dt)) return dt;
    }
    throw std::invalid_argument("unknown dtype '" + name + "'");
}

// ---------------------------------------------------------------------------
// Tensor static factory
// ---------------------------------------------------------------------------
Tensor Tensor::make(std::vector<size_t> shape, DType dtype, Device device) {
    if (dtype_bytes(dtype) == 0)
        throw std::invalid_argument("Tensor::make: unknown DType");

    Tensor t;
    t.strides = c_order_strides(shape);
    t.shape   = std::move(shape);
    t.dtype   = dtype;
    t.device  = device;

    const size_t bytes = t.nbytes();
    if (bytes == 0) return t;

    if (device == Device::CPU) {
        t.data = ::operator new(bytes);
        std::memset(t.data, 0, bytes);
    } else {
        DIGITSET_CUDA_CHECK(cudaMalloc(&t.data, bytes));
        DIGITSET_CUDA_CHECK(cudaMemset(t.data, 0, bytes));
    }
    return t;
}

// ---------------------------------------------------------------------------
// Destructor / move
// ---------------------------------------------------------------------------
void Tensor::free_data() {
    if (!data) return;
    if (device == Device::CPU) {
        ::operator delete(data);
    } else {
        // Ignore CUDA error during destruction to avoid throwing in destructor.
        cudaFree(data);
    }
    data = nullptr;
}

Tensor::~Tensor() {
    free_data();
}

Tensor::Tensor(Tensor&& other) noexcept
    : data(other.data)
    , shape(std::move(other.shape))
    , strides(std::move(other.strides))
    , dtype(other.dtype)
    , device(other.device)
{
    other.data = nullptr;
}

Tensor& Tensor::operator=(Tensor&& other) noexcept {
    if (this == &other) return *this;
    free_data();
    data    = other.data;
    shape   = std::move(other.shape);
    strides = std::move(other.strides);
    dtype   = other.dtype;
    device  = other.device;
    other.data = nullptr;
    return *this;
}

// ---------------------------------------------------------------------------
// Properties
// ---------------------------------------------------------------------------
size_t Tensor::numel() const noexcept {
    if (shape.empty()) return 0;
    size_t n = 1;
    for (size_t s : shape) n *= s;
    return n;
}

size_t Tensor::nbytes() const noexcept {
    return numel() * dtype_bytes(dtype);
}

bool Tensor::is_contiguous() const noexcept {
    return strides == c_order_strides(shape);
}

void Tensor::require_host() const {
    if (device != Device::CPU)
        throw std::runtime_error("Tensor: host access to a " +
                                 std::string(device_name(device)) + " tensor");
}

// ---------------------------------------------------------------------------
// Device transfer
// ---------------------------------------------------------------------------
Tensor Tensor::to(Device target) const {
    Tensor dst = Tensor::make(shape, dtype, target);
    const size_t bytes = nbytes();
    if (bytes == 0) return dst;

    if (device == Device::CPU && target == Device::CPU) {
        std::memcpy(dst.data, data, bytes);
    } else if (device == Device::CPU) {
        DIGITSET_CUDA_CHECK(cudaMemcpy(dst.data, data, bytes, cudaMemcpyHostToDevice));
    } else if (target == Device::CPU) {
        DIGITSET_CUDA_CHECK(cudaMemcpy(dst.data, data, bytes, cudaMemcpyDeviceToHost));
    } else {
        DIGITSET_CUDA_CHECK(cudaMemcpy(dst.data, data, bytes, cudaMemcpyDeviceToDevice));
    }
    return dst;
}

} // namespace digitset
