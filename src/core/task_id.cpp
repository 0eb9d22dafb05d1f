/**
 * @file task_id.cpp
 * @brief Implementation of task_id generation and serialization
 */

#include "kcenon/upload_orchestrator/core/task_id.h"

#include <cctype>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>

namespace kcenon::upload_orchestrator {

namespace {

auto id_engine() -> std::mt19937_64& {
    static std::mt19937_64 engine{std::random_device{}()};
    return engine;
}

std::mutex id_engine_mutex;

}  // namespace

auto task_id::generate() -> task_id {
    uint64_t high = 0;
    uint64_t low = 0;
    {
        std::lock_guard<std::mutex> lock(id_engine_mutex);
        std::uniform_int_distribution<uint64_t> dis;
        high = dis(id_engine());
        low = dis(id_engine());
    }

    task_id id;
    for (int i = 0; i < 8; ++i) {
        id.bytes[i] = static_cast<uint8_t>(high >> (56 - i * 8));
        id.bytes[i + 8] = static_cast<uint8_t>(low >> (56 - i * 8));
    }

    // Version 4, variant 10xx
    id.bytes[6] = static_cast<uint8_t>((id.bytes[6] & 0x0F) | 0x40);
    id.bytes[8] = static_cast<uint8_t>((id.bytes[8] & 0x3F) | 0x80);

    return id;
}

auto task_id::to_string() const -> std::string {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            oss << '-';
        }
        oss << std::setw(2) << static_cast<int>(bytes[i]);
    }

    return oss.str();
}

auto task_id::from_string(std::string_view str) -> std::optional<task_id> {
    std::string hex;
    hex.reserve(32);

    for (char c : str) {
        if (c == '-') continue;
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        hex += c;
    }

    if (hex.size() != 32) {
        return std::nullopt;
    }

    task_id id;
    for (std::size_t i = 0; i < 16; ++i) {
        id.bytes[i] = static_cast<uint8_t>(std::stoul(hex.substr(i * 2, 2), nullptr, 16));
    }
    return id;
}

}  // namespace kcenon::upload_orchestrator
