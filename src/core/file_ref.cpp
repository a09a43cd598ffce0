/**
 * @file file_ref.cpp
 * @brief Implementation of file_ref
 */

#include <kcenon/storage_transfer/core/file_ref.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <string_view>
#include <utility>

namespace kcenon::storage_transfer {

namespace {

struct mime_entry {
    std::string_view extension;
    std::string_view mime_type;
};

constexpr std::array<mime_entry, 24> mime_table = {{
    {".jpg", "image/jpeg"},
    {".jpeg", "image/jpeg"},
    {".png", "image/png"},
    {".gif", "image/gif"},
    {".webp", "image/webp"},
    {".avif", "image/avif"},
    {".svg", "image/svg+xml"},
    {".bmp", "image/bmp"},
    {".pdf", "application/pdf"},
    {".zip", "application/zip"},
    {".gz", "application/gzip"},
    {".json", "application/json"},
    {".xml", "application/xml"},
    {".txt", "text/plain"},
    {".csv", "text/csv"},
    {".html", "text/html"},
    {".css", "text/css"},
    {".js", "text/javascript"},
    {".md", "text/markdown"},
    {".mp3", "audio/mpeg"},
    {".wav", "audio/wav"},
    {".mp4", "video/mp4"},
    {".webm", "video/webm"},
    {".mov", "video/quicktime"},
}};

/**
 * @brief istream over a shared in-memory buffer without copying it
 */
class shared_buffer_streambuf : public std::streambuf {
public:
    explicit shared_buffer_streambuf(std::shared_ptr<const std::vector<std::byte>> data)
        : data_(std::move(data)) {
        auto* begin = const_cast<char*>(reinterpret_cast<const char*>(data_->data()));
        setg(begin, begin, begin + data_->size());
    }

private:
    std::shared_ptr<const std::vector<std::byte>> data_;
};

class shared_buffer_istream : public std::istream {
public:
    explicit shared_buffer_istream(std::shared_ptr<const std::vector<std::byte>> data)
        : std::istream(nullptr), buf_(std::move(data)) {
        rdbuf(&buf_);
    }

private:
    shared_buffer_streambuf buf_;
};

}  // namespace

auto guess_content_type(const std::string& filename) -> std::string {
    auto dot = filename.find_last_of('.');
    if (dot == std::string::npos) {
        return "application/octet-stream";
    }

    std::string ext = filename.substr(dot);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const auto& entry : mime_table) {
        if (entry.extension == ext) {
            return std::string(entry.mime_type);
        }
    }
    return "application/octet-stream";
}

auto file_ref::from_path(const std::filesystem::path& path, std::string content_type)
    -> result<file_ref> {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return unexpected(error(error_kind::not_found, "File not found: " + path.string()));
    }
    if (!std::filesystem::is_regular_file(path, ec)) {
        return unexpected(error(error_kind::validation, "Not a regular file: " + path.string()));
    }

    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return unexpected(error(error_kind::internal,
                                "Cannot read file size: " + ec.message()));
    }

    file_ref ref;
    ref.name_ = path.filename().string();
    ref.content_type_ = content_type.empty() ? guess_content_type(ref.name_)
                                             : std::move(content_type);
    ref.size_ = static_cast<uint64_t>(size);
    ref.path_ = path;
    return ref;
}

auto file_ref::from_buffer(std::string name, std::vector<std::byte> data,
                           std::string content_type) -> file_ref {
    file_ref ref;
    ref.content_type_ = content_type.empty() ? guess_content_type(name)
                                             : std::move(content_type);
    ref.name_ = std::move(name);
    ref.size_ = data.size();
    ref.buffer_ = std::make_shared<const std::vector<std::byte>>(std::move(data));
    return ref;
}

auto file_ref::buffer() const -> std::span<const std::byte> {
    if (!buffer_) {
        return {};
    }
    return std::span<const std::byte>(buffer_->data(), buffer_->size());
}

auto file_ref::open() const -> result<std::unique_ptr<std::istream>> {
    if (buffer_) {
        return std::unique_ptr<std::istream>(
            std::make_unique<shared_buffer_istream>(buffer_));
    }

    if (path_.empty()) {
        return unexpected(error(error_kind::validation, "Empty file reference"));
    }

    auto stream = std::make_unique<std::ifstream>(path_, std::ios::binary);
    if (!stream->is_open()) {
        return unexpected(error(error_kind::not_found,
                                "Cannot open file: " + path_.string()));
    }
    return std::unique_ptr<std::istream>(std::move(stream));
}

auto file_ref::read_all() const -> result<std::vector<std::byte>> {
    if (buffer_) {
        return *buffer_;
    }

    auto stream = open();
    if (!stream) {
        return unexpected(stream.error());
    }

    std::vector<std::byte> data(static_cast<std::size_t>(size_));
    stream.value()->read(reinterpret_cast<char*>(data.data()),
                         static_cast<std::streamsize>(data.size()));
    auto read = static_cast<std::size_t>(stream.value()->gcount());
    if (read != data.size()) {
        return unexpected(error(error_kind::internal,
                                "Short read: expected " + std::to_string(data.size()) +
                                " bytes, got " + std::to_string(read)));
    }
    return data;
}

}  // namespace kcenon::storage_transfer
