/**
 * @file clock.h
 * @brief Injectable wall clock
 */

#ifndef KCENON_STORAGE_TRANSFER_CORE_CLOCK_H
#define KCENON_STORAGE_TRANSFER_CORE_CLOCK_H

#include <chrono>
#include <memory>

namespace kcenon::storage_transfer {

/**
 * @brief Source of the current time
 *
 * Signed-URL expiry is wall-clock based, so the cache compares against
 * system_clock. Tests substitute a manually advanced clock.
 */
class clock_source {
public:
    virtual ~clock_source() = default;

    [[nodiscard]] virtual auto now() const -> std::chrono::system_clock::time_point = 0;
};

class system_clock_source : public clock_source {
public:
    [[nodiscard]] auto now() const -> std::chrono::system_clock::time_point override {
        return std::chrono::system_clock::now();
    }
};

[[nodiscard]] inline auto make_system_clock() -> std::shared_ptr<clock_source> {
    return std::make_shared<system_clock_source>();
}

}  // namespace kcenon::storage_transfer

#endif  // KCENON_STORAGE_TRANSFER_CORE_CLOCK_H
