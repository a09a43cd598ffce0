/**
 * @file benchmark_helpers.h
 * @brief Payload and scratch-file helpers shared by the benchmarks
 */

#ifndef KCENON_STORAGE_TRANSFER_BENCHMARKS_BENCHMARK_HELPERS_H
#define KCENON_STORAGE_TRANSFER_BENCHMARKS_BENCHMARK_HELPERS_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace kcenon::storage_transfer::benchmark {

/**
 * @brief Incompressible bytes, reproducible for a non-zero seed
 */
auto random_payload(std::size_t size, uint32_t seed = 0) -> std::vector<std::byte>;

/**
 * @brief Random file in the system temp directory, removed on destruction
 */
class scratch_file {
public:
    scratch_file(const std::string& name, std::size_t size, uint32_t seed = 0);
    ~scratch_file();

    scratch_file(const scratch_file&) = delete;
    auto operator=(const scratch_file&) -> scratch_file& = delete;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

    /**
     * @brief false when the file could not be written
     */
    [[nodiscard]] auto ok() const -> bool { return ok_; }

private:
    std::filesystem::path path_;
    bool ok_ = false;
};

namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;

constexpr std::size_t small_file = 100 * KB;
constexpr std::size_t quick_hash_limit = 1 * MB;
constexpr std::size_t pre_upload_limit = 10 * MB;
constexpr std::size_t large_file = 100 * MB;

// Hasher read sizes
constexpr std::size_t min_chunk = 16 * KB;
constexpr std::size_t default_chunk = 64 * KB;
constexpr std::size_t max_chunk = 1 * MB;
}  // namespace sizes

}  // namespace kcenon::storage_transfer::benchmark

#endif  // KCENON_STORAGE_TRANSFER_BENCHMARKS_BENCHMARK_HELPERS_H
