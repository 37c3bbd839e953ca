#pragma once

#include "types.hpp"

namespace devlink {

    // ─── Reserved virtual pins ───────────────────────────────────────────────────
    inline constexpr PinIndex CONSOLE_PIN = 255; // never backed by hardware

    // ─── Topic prefixes ──────────────────────────────────────────────────────────
    inline constexpr char UPLINK_PREFIX = 'u';
    inline constexpr char DOWNLINK_PREFIX = 'd';
    inline constexpr const char *OTA_TOPIC_SUFFIX = "ota";

    // ─── Timing constants (ms) ───────────────────────────────────────────────────
    inline constexpr u32 STREAM_POLL_INTERVAL_MS = 500;
    inline constexpr u32 RADIO_POLL_INTERVAL_MS = 500;
    inline constexpr u32 DEFAULT_JOIN_TIMEOUT_MS = 10000;
    inline constexpr u32 OTA_REBOOT_DELAY_MS = 1500;

    // ─── Transport limits ────────────────────────────────────────────────────────
    inline constexpr usize NARROW_MAX_PAYLOAD = 12;
    inline constexpr usize RADIO_RECV_MAX = 256;

    // ─── Concentrator channel plan (single-channel gateway, EU868) ──────────────
    inline constexpr u32 CONCENTRATOR_FREQUENCY_HZ = 868100000;
    inline constexpr u8 CONCENTRATOR_CHANNELS = 3;
    inline constexpr u8 RADIO_MAX_CHANNELS = 16;
    inline constexpr u8 RADIO_DR_MIN = 0;
    inline constexpr u8 RADIO_DR_MAX = 5;
    inline constexpr u8 RADIO_SOCKET_DR = 5;

    // ─── Firmware update ─────────────────────────────────────────────────────────
    inline constexpr i32 OTA_RESULT_APPLIED = 2; // reboot required to run the new image

    // ─── Battery ─────────────────────────────────────────────────────────────────
    inline constexpr i32 BATTERY_UNKNOWN = -1;

} // namespace devlink
