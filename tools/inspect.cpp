#include "src/core/error.hpp"
#include "src/io/dataset_config.hpp"
#include "src/io/logger.hpp"
#include "src/io/mnist_dataset.hpp"
#include "src/io/split_loader.hpp"

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct InspectOptions {
    std::string dir;
    std::string config_path;
    std::string log_path;
    bool        raw        = false;
    size_t      threads    = 0;     // 0 = keep config value
    size_t      batch_size = 0;     // 0 = no mini-batch walk
    bool        train      = true;
    bool        test       = true;
};

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " <mnist_dir> [options]\n"
              << "Options:\n"
              << "  --config PATH     JSON dataset config (instead of <mnist_dir>)\n"
              << "  --raw             Read uncompressed *-ubyte files\n"
              << "  --threads N       Fetch threads (default: 4)\n"
              << "  --log PATH        JSONL diagnostics log\n"
              << "  --split S         train, test or both (default: both)\n"
              << "  --batch N         Also walk the split in batches of N\n";
}

void print_split(const digitset::MnistDataset& ds, digitset::Split split, size_t batch_size) {
    using namespace digitset;

    const SplitHeaders hdr = ds.headers(split);
    fmt::print("{} images header: [{}]\n", split_name(split), fmt::join(hdr.images, ", "));
    fmt::print("{} labels header: [{}]\n", split_name(split), fmt::join(hdr.labels, ", "));

    const Batch b = ds.get_split(split);
    fmt::print("{}: {} records  inputs {} {} {}  targets {} {} {}\n",
               split_name(split), ds.size(split),
               shape_string(b.inputs.shape),  dtype_name(b.inputs.dtype),
               device_name(b.inputs.device),
               shape_string(b.targets.shape), dtype_name(b.targets.dtype),
               device_name(b.targets.device));

    std::vector<size_t> histogram(ds.config().num_classes, 0);
    for (int32_t c : ds.labels(split)) ++histogram[static_cast<size_t>(c)];
    fmt::print("  class counts: [{}]\n", fmt::join(histogram, ", "));

    if (batch_size == 0) return;

    auto shared = std::shared_ptr<const MnistDataset>(&ds, [](const MnistDataset*) {});
    SplitLoader loader(shared, split);
    const size_t n_batches = loader.batches_per_epoch(batch_size);
    size_t seen = 0;
    for (size_t i = 0; i < n_batches; ++i) seen += loader.next_batch(batch_size).inputs.shape[0];
    fmt::print("  {} batches of <= {} covering {} records\n", n_batches, batch_size, seen);
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    const std::string first_arg = argv[1];
    if (first_arg == "--help" || first_arg == "-h") {
        print_usage(argv[0]);
        return 0;
    }

    InspectOptions opt;
    int i = 1;
    if (first_arg.rfind("--", 0) != 0) {
        opt.dir = first_arg;
        i = 2;
    }

    try {
        for (; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                opt.config_path = argv[++i];
            } else if (arg == "--raw") {
                opt.raw = true;
            } else if (arg == "--threads" && i + 1 < argc) {
                opt.threads = std::stoull(argv[++i]);
            } else if (arg == "--log" && i + 1 < argc) {
                opt.log_path = argv[++i];
            } else if (arg == "--batch" && i + 1 < argc) {
                opt.batch_size = std::stoull(argv[++i]);
            } else if (arg == "--split" && i + 1 < argc) {
                const std::string s = argv[++i];
                if (s != "train" && s != "test" && s != "both")
                    throw std::invalid_argument("--split must be train, test or both");
                opt.train = s != "test";
                opt.test  = s != "train";
            } else {
                std::cerr << "Unknown option: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }
        if (opt.dir.empty() && opt.config_path.empty()) {
            print_usage(argv[0]);
            return 1;
        }
        if (!opt.dir.empty() && !opt.config_path.empty()) {
            std::cerr << "Give either <mnist_dir> or --config, not both "
                         "(set \"directory\" in the config file instead)\n";
            return 1;
        }

        digitset::DatasetConfig cfg = opt.config_path.empty()
            ? digitset::DatasetConfig::from_directory(opt.dir, !opt.raw)
            : digitset::load_config(opt.config_path);
        if (opt.threads)           cfg.fetch_threads = opt.threads;
        if (!opt.log_path.empty()) cfg.log_path      = opt.log_path;

        std::unique_ptr<digitset::Logger> logger;
        if (!cfg.log_path.empty()) {
            const auto log_dir = std::filesystem::path(cfg.log_path).parent_path();
            if (!log_dir.empty()) std::filesystem::create_directories(log_dir);
            logger = std::make_unique<digitset::Logger>(cfg.log_path);
            logger->attach();
        }

        digitset::MnistDataset ds(cfg);
        fmt::print("loading {} / {} ({} threads)\n",
                   cfg.train_images, cfg.test_images, cfg.fetch_threads);
        ds.load_all();

        if (opt.train) print_split(ds, digitset::Split::Train, opt.batch_size);
        if (opt.test)  print_split(ds, digitset::Split::Test,  opt.batch_size);
    } catch (const digitset::LoadError& ex) {
        std::cerr << "Error (" << digitset::load_error_kind_name(ex.kind()) << "): "
                  << ex.what() << "\n";
        return 2;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }

    return 0;
}
