#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace digitset {

// ---------------------------------------------------------------------------
// FetchError: a fetcher could not produce the bytes for a locator.
// ---------------------------------------------------------------------------
class FetchError : public std::runtime_error {
public:
    FetchError(const std::string& locator, const std::string& reason)
        : std::runtime_error(locator + ": " + reason), locator_(locator) {}

    const std::string& locator() const noexcept { return locator_; }

private:
    std::string locator_;
};

// ---------------------------------------------------------------------------
// ByteFetcher: abstract source of raw record-file bytes.
//
// fetch() returns the full payload for a locator (path, URL, key...). When
// `decompress` is true the payload is compressed at rest / on the wire and
// must be returned already decompressed. Failures throw FetchError.
//
// MnistDataset calls fetch() from several pool threads at once, so
// implementations must be safe for concurrent calls.
//
// Implementations: FileFetcher, or any user-defined transport.
// ---------------------------------------------------------------------------
class ByteFetcher {
public:
    virtual ~ByteFetcher() = default;

    virtual std::vector<uint8_t> fetch(const std::string& locator, bool decompress) = 0;
};

} // namespace digitset
