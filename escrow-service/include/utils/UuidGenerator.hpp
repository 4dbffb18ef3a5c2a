#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace escrow::utils {

/**
 * @brief Идентификаторы платежей, аллокаций, записей журнала и ведомостей (UUID v4)
 *
 * Генератор thread_local, вызовы из разных потоков не синхронизируются.
 */
class UuidGenerator {
public:
    static std::string generate() {
        static constexpr char kHex[] = "0123456789abcdef";

        std::array<uint8_t, 16> bytes = randomBytes();
        bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40); // version 4
        bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80); // RFC 4122 variant

        std::string out;
        out.reserve(36);
        for (size_t i = 0; i < bytes.size(); ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) {
                out += '-';
            }
            out += kHex[bytes[i] >> 4];
            out += kHex[bytes[i] & 0x0F];
        }
        return out;
    }

private:
    static std::array<uint8_t, 16> randomBytes() {
        thread_local std::mt19937_64 engine{std::random_device{}()};

        std::array<uint8_t, 16> bytes{};
        for (size_t offset = 0; offset < bytes.size(); offset += 8) {
            uint64_t chunk = engine();
            for (size_t i = 0; i < 8; ++i) {
                bytes[offset + i] = static_cast<uint8_t>(chunk >> (i * 8));
            }
        }
        return bytes;
    }
};

} // namespace escrow::utils
