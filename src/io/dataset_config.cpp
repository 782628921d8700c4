#include "dataset_config.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

namespace digitset {

// ---------------------------------------------------------------------------
// DatasetConfig
// ---------------------------------------------------------------------------
void DatasetConfig::validate() const {
    if (image_header_bytes % 4 != 0)
        throw std::invalid_argument("image_header_bytes must be a multiple of 4");
    if (label_header_bytes % 4 != 0)
        throw std::invalid_argument("label_header_bytes must be a multiple of 4");
    if (image_height == 0 || image_width == 0)
        throw std::invalid_argument("image_height and image_width must be > 0");
    if (num_classes == 0)
        throw std::invalid_argument("num_classes must be > 0");
    if (fetch_threads == 0)
        throw std::invalid_argument("fetch_threads must be > 0");
    if (input_dtype != DType::Float32 && input_dtype != DType::Float16 &&
        input_dtype != DType::BFloat16)
        throw std::invalid_argument(std::string("input_dtype must be a float type, got ") +
                                    dtype_name(input_dtype));
}

DatasetConfig DatasetConfig::from_directory(const std::string& dir, bool gzipped) {
    const std::filesystem::path base(dir);
    const std::string suffix = gzipped ? ".gz" : "";

    DatasetConfig cfg;
    cfg.train_images = (base / ("train-images-idx3-ubyte" + suffix)).string();
    cfg.train_labels = (base / ("train-labels-idx1-ubyte" + suffix)).string();
    cfg.test_images  = (base / ("t10k-images-idx3-ubyte"  + suffix)).string();
    cfg.test_labels  = (base / ("t10k-labels-idx1-ubyte"  + suffix)).string();
    cfg.decompress   = gzipped;
    return cfg;
}

// ---------------------------------------------------------------------------
// JSON loading
// ---------------------------------------------------------------------------
namespace {

size_t get_size(const std::string& key, const nlohmann::json& v) {
    if (!v.is_number_unsigned())
        throw std::runtime_error("'" + key + "' must be a non-negative integer");
    return v.get<size_t>();
}

void apply(DatasetConfig& cfg, const std::string& key, const nlohmann::json& v) {
    if      (key == "train_images")       cfg.train_images       = v.get<std::string>();
    else if (key == "train_labels")       cfg.train_labels       = v.get<std::string>();
    else if (key == "test_images")        cfg.test_images        = v.get<std::string>();
    else if (key == "test_labels")        cfg.test_labels        = v.get<std::string>();
    else if (key == "decompress")         cfg.decompress         = v.get<bool>();
    else if (key == "image_header_bytes") cfg.image_header_bytes = get_size(key, v);
    else if (key == "label_header_bytes") cfg.label_header_bytes = get_size(key, v);
    else if (key == "image_height")       cfg.image_height       = get_size(key, v);
    else if (key == "image_width")        cfg.image_width        = get_size(key, v);
    else if (key == "num_classes")        cfg.num_classes        = get_size(key, v);
    else if (key == "fetch_threads")      cfg.fetch_threads      = get_size(key, v);
    else if (key == "strict_header")      cfg.strict_header      = v.get<bool>();
    else if (key == "output_device")      cfg.output_device      = parse_device(v.get<std::string>());
    else if (key == "input_dtype")        cfg.input_dtype        = parse_dtype(v.get<std::string>());
    else if (key == "log_path")           cfg.log_path           = v.get<std::string>();
    else throw std::runtime_error("unknown key '" + key + "'");
}

} // namespace

DatasetConfig load_config(const std::string& path) {
    std::ifstream f(path);
    if (!f) throw std::runtime_error("load_config: cannot open " + path);

    try {
        const nlohmann::json j = nlohmann::json::parse(f);
        if (!j.is_object())
            throw std::runtime_error("top-level value must be an object");

        DatasetConfig cfg;
        if (j.contains("directory")) {
            const bool gzipped = j.value("gzipped", true);
            cfg = DatasetConfig::from_directory(j.at("directory").get<std::string>(), gzipped);
        }
        for (const auto& [key, value] : j.items()) {
            if (key == "directory" || key == "gzipped") continue;
            apply(cfg, key, value);
        }
        return cfg;
    } catch (const nlohmann::json::exception& ex) {
        throw std::runtime_error("load_config: " + path + ": " + ex.what());
    } catch (const std::invalid_argument& ex) {
        throw std::runtime_error("load_config: " + path + ": " + ex.what());
    } catch (const std::runtime_error& ex) {
        throw std::runtime_error("load_config: " + path + ": " + ex.what());
    }
}

} // namespace digitset
