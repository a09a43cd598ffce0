/**
 * @file content_hasher.cpp
 * @brief Implementation of content_hasher over OpenSSL EVP
 */

#include <kcenon/storage_transfer/core/content_hasher.h>
#include <kcenon/storage_transfer/core/logging.h>

#include <algorithm>
#include <array>
#include <iomanip>
#include <sstream>
#include <thread>
#include <vector>

#if STORAGE_TRANS_HAS_DIGEST
#include <openssl/err.h>
#include <openssl/evp.h>
#endif

namespace kcenon::storage_transfer {

namespace {

#if STORAGE_TRANS_HAS_DIGEST

auto get_openssl_error() -> std::string {
    unsigned long err = ERR_get_error();
    if (err == 0) {
        return "Unknown OpenSSL error";
    }
    std::array<char, 256> buffer{};
    ERR_error_string_n(err, buffer.data(), buffer.size());
    return std::string(buffer.data());
}

/**
 * @brief Incremental SHA-256 over an owned EVP_MD_CTX
 */
class sha256_digest {
public:
    sha256_digest() : ctx_(EVP_MD_CTX_new()) {
        if (ctx_ && EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
            EVP_MD_CTX_free(ctx_);
            ctx_ = nullptr;
        }
    }

    ~sha256_digest() {
        if (ctx_) {
            EVP_MD_CTX_free(ctx_);
        }
    }

    sha256_digest(const sha256_digest&) = delete;
    auto operator=(const sha256_digest&) -> sha256_digest& = delete;

    [[nodiscard]] explicit operator bool() const { return ctx_ != nullptr; }

    [[nodiscard]] auto update(const void* data, std::size_t size) -> bool {
        return EVP_DigestUpdate(ctx_, data, size) == 1;
    }

    [[nodiscard]] auto finish() -> result<std::string> {
        std::array<unsigned char, EVP_MAX_MD_SIZE> md{};
        unsigned int md_len = 0;
        if (EVP_DigestFinal_ex(ctx_, md.data(), &md_len) != 1) {
            return unexpected(error(error_kind::internal, get_openssl_error()));
        }

        std::ostringstream oss;
        oss << std::hex << std::setfill('0');
        for (unsigned int i = 0; i < md_len; ++i) {
            oss << std::setw(2) << static_cast<int>(md[i]);
        }
        return oss.str();
    }

private:
    EVP_MD_CTX* ctx_;
};

#endif  // STORAGE_TRANS_HAS_DIGEST

auto unavailable_error() -> error {
    return error(error_kind::hash_unavailable,
                 "SHA-256 not available (built without STORAGE_TRANS_ENABLE_DIGEST)");
}

}  // namespace

content_hasher::content_hasher(hasher_config config) : config_(config) {
    if (config_.chunk_size == 0) {
        config_.chunk_size = hasher_config{}.chunk_size;
    }
}

auto content_hasher::is_available() noexcept -> bool {
    return STORAGE_TRANS_HAS_DIGEST != 0;
}

auto content_hasher::should_hash(const file_ref& file, hash_mode mode) const -> bool {
    if (!is_available()) {
        return false;
    }
    switch (mode) {
        case hash_mode::quick:
            return file.size() <= config_.quick_threshold;
        case hash_mode::pre_upload:
            return file.size() <= config_.pre_upload_threshold;
    }
    return false;
}

auto content_hasher::hash_buffer(std::span<const std::byte> data) -> result<std::string> {
#if STORAGE_TRANS_HAS_DIGEST
    sha256_digest digest;
    if (!digest) {
        return unexpected(error(error_kind::internal, get_openssl_error()));
    }
    if (!digest.update(data.data(), data.size())) {
        return unexpected(error(error_kind::internal, get_openssl_error()));
    }
    return digest.finish();
#else
    (void)data;
    return unexpected(unavailable_error());
#endif
}

auto content_hasher::hash_quick(const file_ref& file) const -> result<std::string> {
    if (file.size() > config_.quick_threshold) {
        return unexpected(error(error_kind::validation,
            "File exceeds quick-hash threshold of " +
            std::to_string(config_.quick_threshold) + " bytes"));
    }
    if (file.is_buffered()) {
        return hash_buffer(file.buffer());
    }

    auto data = file.read_all();
    if (!data) {
        return unexpected(data.error());
    }
    return hash_buffer(data.value());
}

auto content_hasher::hash(const file_ref& file, const hash_request& request) const
    -> result<std::string> {
#if STORAGE_TRANS_HAS_DIGEST
    sha256_digest digest;
    if (!digest) {
        return unexpected(error(error_kind::internal, get_openssl_error()));
    }

    const uint64_t total = file.size();
    uint64_t hashed = 0;

    auto report = [&] {
        if (request.on_progress) {
            request.on_progress(hashed, total);
        }
    };
    auto is_cancelled = [&] {
        return request.cancel && request.cancel->is_cancelled();
    };

    if (file.is_buffered()) {
        auto bytes = file.buffer();
        while (hashed < bytes.size()) {
            if (is_cancelled()) {
                return unexpected(error(error_kind::cancelled, "Hashing cancelled"));
            }
            auto n = std::min<std::size_t>(config_.chunk_size,
                                           bytes.size() - static_cast<std::size_t>(hashed));
            if (!digest.update(bytes.data() + hashed, n)) {
                return unexpected(error(error_kind::internal, get_openssl_error()));
            }
            hashed += n;
            report();
            std::this_thread::yield();
        }
    } else {
        auto stream = file.open();
        if (!stream) {
            return unexpected(stream.error());
        }

        std::vector<char> chunk(config_.chunk_size);
        auto& in = *stream.value();
        while (in) {
            if (is_cancelled()) {
                return unexpected(error(error_kind::cancelled, "Hashing cancelled"));
            }
            in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
            auto n = static_cast<std::size_t>(in.gcount());
            if (n == 0) {
                break;
            }
            if (!digest.update(chunk.data(), n)) {
                return unexpected(error(error_kind::internal, get_openssl_error()));
            }
            hashed += n;
            report();
            std::this_thread::yield();
        }

        if (in.bad()) {
            return unexpected(error(error_kind::internal,
                                    "Read error while hashing " + file.name()));
        }
    }

    if (total == 0) {
        report();
    }

    auto hex = digest.finish();
    if (hex) {
        ST_LOG_DEBUG(log_category::hasher,
                     "Hashed " + file.name() + " (" + std::to_string(hashed) + " bytes)");
    }
    return hex;
#else
    (void)file;
    (void)request;
    return unexpected(unavailable_error());
#endif
}

}  // namespace kcenon::storage_transfer
