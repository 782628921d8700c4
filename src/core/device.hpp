#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

#include <cuda_runtime.h>

namespace digitset {

// ---------------------------------------------------------------------------
// Device tag
// ---------------------------------------------------------------------------
enum class Device : uint8_t {
    CPU  = 0,
    CUDA = 1,
};

inline const char* device_name(Device d) noexcept {
    return d == Device::CPU ? "cpu" : "cuda";
}

// Inverse of device_name(); used when reading configuration files.
inline Device parse_device(const std::string& name) {
    if (name == "cpu")  return Device::CPU;
    if (name == "cuda") return Device::CUDA;
    throw std::invalid_argument("unknown device '" + name + "' (expected cpu or cuda)");
}

// ---------------------------------------------------------------------------
// CUDA error handling
// ---------------------------------------------------------------------------
struct CudaError : std::runtime_error {
    explicit CudaError(cudaError_t err, const char* file, int line)
        : std::runtime_error(
              std::string(cudaGetErrorString(err)) +
              " [" + file + ":" + std::to_string(line) + "]")
    {}
};

#define DIGITSET_CUDA_CHECK(expr)                                      \
    do {                                                               \
        cudaError_t _digitset_err = (expr);                            \
        if (_digitset_err != cudaSuccess)                              \
            throw digitset::CudaError(_digitset_err, __FILE__, __LINE__); \
    } while (0)

} // namespace digitset
