#pragma once

#include "byte_fetcher.hpp"

#include <string>
#include <vector>

namespace digitset {

// ---------------------------------------------------------------------------
// FileFetcher: reads record files from the local filesystem.
//
// decompress == true reads through zlib's gzip reader (plain files are passed
// through unchanged by zlib, so a non-gzipped file is still accepted).
// decompress == false reads the bytes verbatim.
//
// Relative locators are resolved against `root` when it is non-empty.
// Stateless apart from `root`; safe for concurrent fetch() calls.
// ---------------------------------------------------------------------------
class FileFetcher : public ByteFetcher {
public:
    explicit FileFetcher(std::string root = {});

    std::vector<uint8_t> fetch(const std::string& locator, bool decompress) override;

    const std::string& root() const { return root_; }

private:
    std::string resolve(const std::string& locator) const;

    static std::vector<uint8_t> read_plain(const std::string& path);
    static std::vector<uint8_t> read_gzip(const std::string& path);

    std::string root_;
};

} // namespace digitset
