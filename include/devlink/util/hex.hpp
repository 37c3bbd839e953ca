#pragma once

#include "../core/error.hpp"
#include "../core/types.hpp"
#include <datapod/datapod.hpp>

namespace devlink {
    namespace util {

        inline i32 hex_nibble(char c) noexcept {
            if (c >= '0' && c <= '9')
                return c - '0';
            if (c >= 'a' && c <= 'f')
                return c - 'a' + 10;
            if (c >= 'A' && c <= 'F')
                return c - 'A' + 10;
            return -1;
        }

        // ─── Hex string to bytes ─────────────────────────────────────────────────────
        // Spaces are ignored so keys may be written as "00 11 22 33".
        inline Result<Bytes> parse_hex(const dp::String &text) {
            Bytes out;
            i32 high = -1;
            for (usize i = 0; i < text.size(); ++i) {
                char c = text[i];
                if (c == ' ')
                    continue;
                i32 nibble = hex_nibble(c);
                if (nibble < 0) {
                    return Result<Bytes>::err(Error::invalid_data("invalid hex digit in '" + text + "'"));
                }
                if (high < 0) {
                    high = nibble;
                } else {
                    out.push_back(static_cast<u8>((high << 4) | nibble));
                    high = -1;
                }
            }
            if (high >= 0) {
                return Result<Bytes>::err(Error::invalid_data("odd number of hex digits in '" + text + "'"));
            }
            return Result<Bytes>::ok(std::move(out));
        }

        // Big-endian 32-bit value from exactly four hex-encoded bytes
        inline Result<u32> parse_hex_u32(const dp::String &text) {
            auto bytes = parse_hex(text);
            if (!bytes.is_ok())
                return Result<u32>::err(bytes.error());
            if (bytes.value().size() != 4) {
                return Result<u32>::err(Error::invalid_data("expected 4 bytes in '" + text + "'"));
            }
            const auto &b = bytes.value();
            u32 value = (static_cast<u32>(b[0]) << 24) | (static_cast<u32>(b[1]) << 16) |
                        (static_cast<u32>(b[2]) << 8) | static_cast<u32>(b[3]);
            return Result<u32>::ok(value);
        }

    } // namespace util
    using namespace util;
} // namespace devlink
