#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <random>
#include <string>

namespace finance::utils {

/**
 * @brief Идентификаторы записей журнала
 *
 * Счета, транзакции, группы переводов и счета к оплате получают
 * UUID v4 в нижнем регистре: "3f2b8c1e-9a4d-4e7b-b1c2-0d5e6f7a8b9c".
 * Такой же формат уже лежит в сохранённых снимках профилей,
 * поэтому старые и новые id сравниваются как обычные строки.
 *
 * @note thread_local генератор, вызывать можно из любого потока
 */
class UuidGenerator {
public:
    static constexpr size_t LENGTH = 36;

    static std::string generate() {
        thread_local std::mt19937_64 gen{std::random_device{}()};

        std::array<uint8_t, 16> bytes{};
        for (size_t i = 0; i < bytes.size(); i += 8) {
            uint64_t chunk = gen();
            for (size_t b = 0; b < 8; ++b) {
                bytes[i + b] = static_cast<uint8_t>(chunk >> (b * 8));
            }
        }
        bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);  // version 4
        bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);  // RFC 4122 variant

        static constexpr char HEX[] = "0123456789abcdef";
        std::string id;
        id.reserve(LENGTH);
        for (size_t i = 0; i < bytes.size(); ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) {
                id.push_back('-');
            }
            id.push_back(HEX[bytes[i] >> 4]);
            id.push_back(HEX[bytes[i] & 0x0F]);
        }
        return id;
    }
};

} // namespace finance::utils
