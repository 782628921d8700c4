#include "file_fetcher.hpp"

#include <zlib.h>

#include <filesystem>
#include <fstream>
#include <utility>

namespace digitset {

namespace {

constexpr unsigned GZ_CHUNK = 1u << 16;

// RAII owner of a zlib read handle.
struct GzFile {
    gzFile fp = nullptr;

    explicit GzFile(const std::string& path) : fp(gzopen(path.c_str(), "rb")) {}
    ~GzFile() { if (fp) gzclose_r(fp); }

    GzFile(const GzFile&) = delete;
    GzFile& operator=(const GzFile&) = delete;

    std::string last_error() const {
        int errnum = Z_OK;
        const char* msg = gzerror(fp, &errnum);
        return msg ? msg : "unknown zlib error";
    }
};

} // namespace

FileFetcher::FileFetcher(std::string root) : root_(std::move(root)) {}

std::string FileFetcher::resolve(const std::string& locator) const {
    std::filesystem::path p(locator);
    if (root_.empty() || p.is_absolute()) return p.string();
    return (std::filesystem::path(root_) / p).string();
}

std::vector<uint8_t> FileFetcher::fetch(const std::string& locator, bool decompress) {
    const std::string path = resolve(locator);

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec))
        throw FetchError(locator, "no such file " + path);

    return decompress ? read_gzip(path) : read_plain(path);
}

std::vector<uint8_t> FileFetcher::read_plain(const std::string& path) {
    std::ifstream f(path, std::ios::binary | std::ios::ate);
    if (!f) throw FetchError(path, "cannot open");

    const std::streamsize size = f.tellg();
    if (size < 0) throw FetchError(path, "cannot determine size");
    f.seekg(0, std::ios::beg);

    std::vector<uint8_t> bytes(static_cast<size_t>(size));
    if (size > 0) {
        f.read(reinterpret_cast<char*>(bytes.data()), size);
        if (!f) throw FetchError(path, "short read");
    }
    return bytes;
}

std::vector<uint8_t> FileFetcher::read_gzip(const std::string& path) {
    GzFile gz(path);
    if (!gz.fp) throw FetchError(path, "cannot open");

    std::vector<uint8_t> bytes;
    while (true) {
        const size_t base = bytes.size();
        bytes.resize(base + GZ_CHUNK);
        const int n = gzread(gz.fp, bytes.data() + base, GZ_CHUNK);
        if (n < 0) throw FetchError(path, "gzip: " + gz.last_error());
        bytes.resize(base + static_cast<size_t>(n));
        if (n == 0) break;
    }

    // gzread() returns 0 both at a clean end and on a truncated stream.
    int errnum = Z_OK;
    gzerror(gz.fp, &errnum);
    if (errnum != Z_OK && errnum != Z_STREAM_END)
        throw FetchError(path, "gzip: " + gz.last_error());

    return bytes;
}

} // namespace digitset
