/**
 * @file file_validation.h
 * @brief Client-side size and type checks before an upload
 */

#ifndef KCENON_STORAGE_TRANSFER_UPLOAD_FILE_VALIDATION_H
#define KCENON_STORAGE_TRANSFER_UPLOAD_FILE_VALIDATION_H

#include "kcenon/storage_transfer/core/file_ref.h"
#include "kcenon/storage_transfer/core/upload_types.h"

#include <string>

namespace kcenon::storage_transfer {

/**
 * @brief Check a file against size and type rules
 *
 * An allowed type matches when it is "*", the exact MIME type, a category
 * wildcard (a "type/" prefix followed by a star) covering the MIME type, or
 * the file extension (with or without
 * the leading dot, case-insensitive). An empty list allows every type.
 */
[[nodiscard]] auto validate_file(const file_ref& file, const validation_options& options = {})
    -> validation_result;

/**
 * @brief Whether a single allowed-type pattern matches the file
 */
[[nodiscard]] auto matches_allowed_type(const file_ref& file, const std::string& allowed)
    -> bool;

}  // namespace kcenon::storage_transfer

#endif  // KCENON_STORAGE_TRANSFER_UPLOAD_FILE_VALIDATION_H
