#pragma once

#include "device.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <stdexcept>

namespace digitset {

// ---------------------------------------------------------------------------
// Data types
// ---------------------------------------------------------------------------
enum class DType : uint8_t {
    Float32  = 0,
    Float16  = 1,
    BFloat16 = 2,
    Int32    = 3,
    Int64    = 4,
};

// Element size in bytes (0 for unknown types).
inline size_t dtype_bytes(DType dt) noexcept {
    switch (dt) {
        case DType::Float32:  return 4;
        case DType::Float16:  return 2;
        case DType::BFloat16: return 2;
        case DType::Int32:    return 4;
        case DType::Int64:    return 8;
        default:              return 0;
    }
}

inline const char* dtype_name(DType dt) {
    switch (dt) {
        case DType::Float32:  return "float32";
        case DType::Float16:  return "float16";
        case DType::BFloat16: return "bfloat16";
        case DType::Int32:    return "int32";
        case DType::Int64:    return "int64";
    }
    throw std::invalid_argument("Unknown DType");
}

DType parse_dtype(const std::string& name);

// ---------------------------------------------------------------------------
// Tensor: owning, RAII, host or device buffer with a logical shape.
//
// Batches produced by the dataset are Tensors: images as [N, H, W, 1] and
// one-hot labels as [N, C]. Non-copyable; move it or call to() for a copy.
// ---------------------------------------------------------------------------
struct Tensor {
    void*               data    = nullptr;
    std::vector<size_t> shape;
    std::vector<size_t> strides;   // in elements
    DType               dtype   = DType::Float32;
    Device              device  = Device::CPU;

    Tensor() = default;
    ~Tensor();

    Tensor(const Tensor&) = delete;
    Tensor& operator=(const Tensor&) = delete;
    Tensor(Tensor&&) noexcept;
    Tensor& operator=(Tensor&&) noexcept;

    // Allocate a zero-filled contiguous C-order (row-major) tensor.
    static Tensor make(std::vector<size_t> shape, DType dtype, Device device);

    // Total number of elements.
    size_t numel() const noexcept;

    // Size in bytes.
    size_t nbytes() const noexcept;

    // True if strides are contiguous C-order.
    bool is_contiguous() const noexcept;

    // Return a new tensor on the target device (always copies).
    Tensor to(Device target) const;

    // Typed host access. Throws if the tensor lives on the GPU.
    template<typename T> T*       host_data();
    template<typename T> const T* host_data() const;

private:
    void free_data();
    void require_host() const;
};

// Compute C-order strides for a given shape.
std::vector<size_t> c_order_strides(const std::vector<size_t>& shape);

// "[a, b, c]" rendering of a shape, for diagnostics.
std::string shape_string(const std::vector<size_t>& shape);

// ---------------------------------------------------------------------------
// Template implementations
// ---------------------------------------------------------------------------
template<typename T>
T* Tensor::host_data() {
    require_host();
    return static_cast<T*>(data);
}

template<typename T>
const T* Tensor::host_data() const {
    require_host();
    return static_cast<const T*>(data);
}

} // namespace digitset
