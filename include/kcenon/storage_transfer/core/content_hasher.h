/**
 * @file content_hasher.h
 * @brief SHA-256 content digests for duplicate detection
 */

#ifndef KCENON_STORAGE_TRANSFER_CORE_CONTENT_HASHER_H
#define KCENON_STORAGE_TRANSFER_CORE_CONTENT_HASHER_H

#include <kcenon/storage_transfer/core/cancellation.h>
#include <kcenon/storage_transfer/core/file_ref.h>
#include <kcenon/storage_transfer/core/types.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>

namespace kcenon::storage_transfer {

/**
 * @brief Hasher configuration
 */
struct hasher_config {
    std::size_t chunk_size = 64 * 1024;                 // 64KB reads
    uint64_t quick_threshold = 1024 * 1024;             // 1MB
    uint64_t pre_upload_threshold = 10 * 1024 * 1024;   // 10MB
};

/**
 * @brief Which size ceiling applies to a hashing request
 */
enum class hash_mode {
    quick,       ///< Small files, whole content may be buffered
    pre_upload   ///< Opportunistic digest before an upload
};

/**
 * @brief Per-call hashing controls
 */
struct hash_request {
    std::function<void(uint64_t bytes_hashed, uint64_t bytes_total)> on_progress;
    std::optional<cancellation_token> cancel;
};

/**
 * @brief Computes lowercase hex SHA-256 digests of file content
 *
 * Streams in fixed-size chunks so memory stays bounded by chunk_size, and
 * yields between chunks. The digest does not depend on chunk size or on
 * whether the file is buffer- or path-backed.
 *
 * Requires a build with STORAGE_TRANS_ENABLE_DIGEST (OpenSSL). Otherwise
 * every call fails with error_kind::hash_unavailable.
 */
class content_hasher {
public:
    explicit content_hasher(hasher_config config = {});

    /**
     * @brief Whether this build can compute digests
     */
    [[nodiscard]] static auto is_available() noexcept -> bool;

    /**
     * @brief Whether a file is small enough to hash for the given mode
     */
    [[nodiscard]] auto should_hash(const file_ref& file, hash_mode mode) const -> bool;

    /**
     * @brief Streaming digest of a file
     *
     * Buffer-backed files are hashed from memory without I/O.
     */
    [[nodiscard]] auto hash(const file_ref& file, const hash_request& request = {}) const
        -> result<std::string>;

    /**
     * @brief Digest of a small file read into memory in one go
     * @return validation error if the file exceeds quick_threshold
     */
    [[nodiscard]] auto hash_quick(const file_ref& file) const -> result<std::string>;

    /**
     * @brief Digest of a byte range
     */
    [[nodiscard]] static auto hash_buffer(std::span<const std::byte> data)
        -> result<std::string>;

    [[nodiscard]] auto config() const -> const hasher_config& { return config_; }

private:
    hasher_config config_;
};

}  // namespace kcenon::storage_transfer

#endif  // KCENON_STORAGE_TRANSFER_CORE_CONTENT_HASHER_H
