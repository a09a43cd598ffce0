/**
 * @file file_ref.h
 * @brief Handle to the source bytes of an upload
 */

#ifndef KCENON_STORAGE_TRANSFER_CORE_FILE_REF_H
#define KCENON_STORAGE_TRANSFER_CORE_FILE_REF_H

#include <kcenon/storage_transfer/core/types.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace kcenon::storage_transfer {

/**
 * @brief Opaque handle to a file to be uploaded
 *
 * Either backed by a path on disk (streamed on demand) or by an in-memory
 * buffer. Size, name and content type are known up front. Copies share the
 * underlying buffer.
 */
class file_ref {
public:
    file_ref() = default;

    /**
     * @brief Reference a regular file on disk
     * @param path File path
     * @param content_type MIME type; guessed from the extension when empty
     * @return file_ref or error (not_found, validation)
     */
    [[nodiscard]] static auto from_path(const std::filesystem::path& path,
                                        std::string content_type = {})
        -> result<file_ref>;

    /**
     * @brief Reference bytes already held in memory
     */
    [[nodiscard]] static auto from_buffer(std::string name,
                                          std::vector<std::byte> data,
                                          std::string content_type = {}) -> file_ref;

    [[nodiscard]] auto name() const -> const std::string& { return name_; }
    [[nodiscard]] auto size() const -> uint64_t { return size_; }
    [[nodiscard]] auto content_type() const -> const std::string& { return content_type_; }
    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

    /**
     * @brief Whether the bytes live in memory
     */
    [[nodiscard]] auto is_buffered() const -> bool { return buffer_ != nullptr; }

    /**
     * @brief In-memory bytes; empty span for path-backed files
     */
    [[nodiscard]] auto buffer() const -> std::span<const std::byte>;

    /**
     * @brief Open a fresh stream over the bytes, positioned at the start
     */
    [[nodiscard]] auto open() const -> result<std::unique_ptr<std::istream>>;

    /**
     * @brief Read the whole content into memory
     */
    [[nodiscard]] auto read_all() const -> result<std::vector<std::byte>>;

private:
    std::string name_;
    std::string content_type_;
    uint64_t size_ = 0;
    std::filesystem::path path_;
    std::shared_ptr<const std::vector<std::byte>> buffer_;
};

/**
 * @brief MIME type for a file name based on its extension
 * @return application/octet-stream when the extension is unknown
 */
[[nodiscard]] auto guess_content_type(const std::string& filename) -> std::string;

}  // namespace kcenon::storage_transfer

#endif  // KCENON_STORAGE_TRANSFER_CORE_FILE_REF_H
