/**
 * @file read_write.cpp
 * @date 19 Oct 2026
 *
 * @brief Throughput of sequential reads and writes through `file_t`,
 * depending on the block size and the buffering mode of the stream.
 */

#include <unistd.h> // `getpid`

#include <cstdlib>    // `std::getenv`
#include <filesystem> // `std::filesystem::temp_directory_path`
#include <string>     // `std::string`

#include <fmt/format.h>
#include <benchmark/benchmark.h>

#include <cfile/cfile.hpp>

namespace bm = benchmark;
using namespace unum::cfile;

constexpr std::size_t file_size_k = 64 * 1024 * 1024;

static std::string bench_path(char const* name) {
    char const* dir = std::getenv("CFILE_BENCH_PATH");
    auto base = dir ? std::filesystem::path(dir) : std::filesystem::temp_directory_path();
    return (base / fmt::format("cfile_bench_{}_{}", ::getpid(), name)).string();
}

static file_t open_configured(std::string const& path, char const* mode, buffering_t buffering) {
    open_config_t config;
    config.mode = mode;
    config.create_if_missing = true;
    config.buffering = buffering;
    return file_t::open(path, config).throw_or_release();
}

static void write_blocks(bm::State& state, buffering_t buffering) {
    auto const block_size = static_cast<std::size_t>(state.range(0));
    auto const path = bench_path("write");
    auto const block = make_buffer(block_size);

    std::size_t written_bytes = 0;
    for (auto _ : state) {
        file_t file = open_configured(path, truncate_random_access_k, buffering);
        for (std::size_t offset = 0; offset < file_size_k; offset += block_size) {
            file.write_all(block).throw_unhandled();
            written_bytes += block_size;
        }
        file.close().throw_unhandled();
    }

    file_t::open(path, read_only_k).throw_or_release().remove().throw_unhandled();
    state.counters["bytes/s"] = bm::Counter(written_bytes, bm::Counter::kIsRate);
}

static void read_blocks(bm::State& state, buffering_t buffering) {
    auto const block_size = static_cast<std::size_t>(state.range(0));
    auto const path = bench_path("read");
    {
        file_t file = open_configured(path, truncate_random_access_k, buffering_t::full_k);
        file.write_all(make_buffer(file_size_k)).throw_unhandled();
    }

    auto block = make_buffer(block_size);
    std::size_t read_bytes = 0;
    for (auto _ : state) {
        file_t file = open_configured(path, read_only_k, buffering);
        for (std::size_t offset = 0; offset < file_size_k; offset += block_size) {
            auto status = file.read_exact(block);
            if (!status && status.error().kind() != end_of_file_k)
                status.throw_unhandled();
            read_bytes += block_size;
        }
        bm::DoNotOptimize(block.data());
    }

    file_t::open(path, read_only_k).throw_or_release().remove().throw_unhandled();
    state.counters["bytes/s"] = bm::Counter(read_bytes, bm::Counter::kIsRate);
}

static void read_to_end(bm::State& state) {
    auto const path = bench_path("read_to_end");
    {
        file_t file = open_configured(path, truncate_random_access_k, buffering_t::full_k);
        file.write_all(make_buffer(file_size_k)).throw_unhandled();
    }

    bytes_t buffer;
    std::size_t read_bytes = 0;
    for (auto _ : state) {
        file_t file = file_t::open(path, read_only_k).throw_or_release();
        read_bytes += file.read_to_end(buffer).throw_or_release();
        bm::DoNotOptimize(buffer.data());
    }

    file_t::open(path, read_only_k).throw_or_release().remove().throw_unhandled();
    state.counters["bytes/s"] = bm::Counter(read_bytes, bm::Counter::kIsRate);
}

int main(int argc, char** argv) {

    bm::Initialize(&argc, argv);

    struct named_buffering_t {
        char const* name;
        buffering_t buffering;
    };
    static named_buffering_t const bufferings[] = {
        {"full", buffering_t::full_k},
        {"none", buffering_t::none_k},
    };

    for (auto const& named : bufferings) {
        auto buffering = named.buffering;
        bm::RegisterBenchmark(fmt::format("write_blocks/{}", named.name).c_str(),
                              [=](bm::State& s) { write_blocks(s, buffering); })
            ->RangeMultiplier(16)
            ->Range(64, 1024 * 1024)
            ->Unit(bm::kMillisecond)
            ->UseRealTime();
        bm::RegisterBenchmark(fmt::format("read_blocks/{}", named.name).c_str(),
                              [=](bm::State& s) { read_blocks(s, buffering); })
            ->RangeMultiplier(16)
            ->Range(64, 1024 * 1024)
            ->Unit(bm::kMillisecond)
            ->UseRealTime();
    }
    bm::RegisterBenchmark("read_to_end", read_to_end)->Unit(bm::kMillisecond)->UseRealTime();

    bm::RunSpecifiedBenchmarks();
    bm::Shutdown();
    return 0;
}
