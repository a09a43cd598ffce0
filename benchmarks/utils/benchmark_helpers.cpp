/**
 * @file benchmark_helpers.cpp
 * @brief Implementation of the benchmark helpers
 */

#include "utils/benchmark_helpers.h"

#include <fstream>
#include <random>
#include <system_error>

namespace kcenon::storage_transfer::benchmark {

auto random_payload(std::size_t size, uint32_t seed) -> std::vector<std::byte> {
    std::vector<std::byte> data(size);
    std::mt19937 gen(seed == 0 ? std::random_device{}() : seed);
    std::uniform_int_distribution<uint16_t> dis(0, 255);
    for (auto& byte : data) {
        byte = static_cast<std::byte>(dis(gen));
    }
    return data;
}

scratch_file::scratch_file(const std::string& name, std::size_t size, uint32_t seed)
    : path_(std::filesystem::temp_directory_path() / ("storage_trans_bench_" + name)) {
    const auto data = random_payload(size, seed);
    std::ofstream out(path_, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(data.data()),
              static_cast<std::streamsize>(data.size()));
    ok_ = static_cast<bool>(out);
}

scratch_file::~scratch_file() {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
}

}  // namespace kcenon::storage_transfer::benchmark
