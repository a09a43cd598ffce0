/**
 * @file session_id.cpp
 * @brief Implementation of session_id generation
 */

#include <kcenon/storage_transfer/core/types.h>

#include <atomic>
#include <iomanip>
#include <random>
#include <sstream>

namespace kcenon::storage_transfer {

auto session_id::generate() -> session_id {
    static std::atomic<uint64_t> sequence{0};

    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint32_t> dis;

    auto epoch_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    std::ostringstream oss;
    oss << "upload_" << epoch_ms << '_'
        << std::hex << std::setfill('0') << std::setw(8) << dis(gen)
        << '_' << std::dec << sequence.fetch_add(1, std::memory_order_relaxed);

    return session_id{oss.str()};
}

}  // namespace kcenon::storage_transfer
