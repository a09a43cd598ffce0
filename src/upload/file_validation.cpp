/**
 * @file file_validation.cpp
 * @brief Implementation of client-side file validation
 */

#include "kcenon/storage_transfer/upload/file_validation.h"

#include <algorithm>
#include <cctype>

namespace kcenon::storage_transfer {

namespace {

auto to_lower(std::string value) -> std::string {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

auto extension_of(const std::string& filename) -> std::string {
    auto dot = filename.rfind('.');
    if (dot == std::string::npos || dot + 1 >= filename.size()) {
        return {};
    }
    return to_lower(filename.substr(dot + 1));
}

auto format_megabytes(uint64_t bytes) -> std::string {
    const uint64_t mb = bytes / (1024 * 1024);
    if (mb * 1024 * 1024 == bytes) {
        return std::to_string(mb);
    }
    auto text = std::to_string(static_cast<double>(bytes) / (1024.0 * 1024.0));
    text.erase(text.find_last_not_of('0') + 1);
    if (!text.empty() && text.back() == '.') {
        text.pop_back();
    }
    return text;
}

}  // namespace

auto matches_allowed_type(const file_ref& file, const std::string& allowed) -> bool {
    if (allowed == "*") {
        return true;
    }

    const auto mime = to_lower(file.content_type());
    const auto pattern = to_lower(allowed);

    if (pattern.size() > 2 && pattern.compare(pattern.size() - 2, 2, "/*") == 0) {
        const auto category = pattern.substr(0, pattern.size() - 1);  // keeps the slash
        return mime.rfind(category, 0) == 0;
    }
    if (pattern == mime) {
        return true;
    }

    const auto extension = extension_of(file.name());
    if (extension.empty()) {
        return false;
    }
    return pattern == extension || pattern == "." + extension;
}

auto validate_file(const file_ref& file, const validation_options& options)
    -> validation_result {
    validation_result report;

    if (file.size() > options.max_size) {
        report.errors.push_back("File size exceeds " + format_megabytes(options.max_size) +
                                " MB limit");
    }

    if (!options.allowed_types.empty()) {
        const bool allowed =
            std::any_of(options.allowed_types.begin(), options.allowed_types.end(),
                        [&](const std::string& type) { return matches_allowed_type(file, type); });
        if (!allowed) {
            const auto& type = file.content_type().empty() ? file.name() : file.content_type();
            report.errors.push_back("File type " + type + " is not allowed");
        }
    }

    report.is_valid = report.errors.empty();
    return report;
}

}  // namespace kcenon::storage_transfer
