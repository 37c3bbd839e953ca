#pragma once

#include "constants.hpp"
#include "types.hpp"
#include <datapod/datapod.hpp>
#include <utility>

namespace devlink {

    // ─── Originator class ────────────────────────────────────────────────────────
    enum class Originator : u8 { User = 0, System = 1 };

    // ─── Network type tag ────────────────────────────────────────────────────────
    enum class NetworkType : u8 { Wifi = 0, LoRa = 1, Sigfox = 2 };

    // ─── Message type tags (closed set) ──────────────────────────────────────────
    enum class MessageType : u8 {
        Ping = 0x00,
        Info = 0x01,
        NetworkInfo = 0x02,
        ScanInfo = 0x03,
        BatteryInfo = 0x04,
        Ota = 0x05,
        Command = 0x0E,
    };

    // ─── Pin command sub-types (body byte 0 of a Command message) ───────────────
    enum class PinCommand : u8 {
        PinMode = 0,
        DigitalRead = 1,
        DigitalWrite = 2,
        AnalogRead = 3,
        AnalogWrite = 4,
        CustomMethod = 5,
        CustomLocation = 6,
    };

    inline const char *to_string(MessageType type) noexcept {
        switch (type) {
        case MessageType::Ping:
            return "ping";
        case MessageType::Info:
            return "info";
        case MessageType::NetworkInfo:
            return "network-info";
        case MessageType::ScanInfo:
            return "scan-info";
        case MessageType::BatteryInfo:
            return "battery-info";
        case MessageType::Ota:
            return "ota";
        case MessageType::Command:
            return "command";
        }
        return "unknown";
    }

    // ─── Envelope (decoded logical message) ──────────────────────────────────────
    // The type tag is kept raw: values outside MessageType are inert.
    struct Envelope {
        Originator originator = Originator::User;
        bool persistent = false;
        u8 network_type = 0;
        u8 type = 0;
        Bytes body;

        Envelope() = default;

        Envelope(Originator orig, MessageType t, Bytes b = {}, bool persist = false)
            : originator(orig), persistent(persist), type(static_cast<u8>(t)), body(std::move(b)) {}

        bool is_system() const noexcept { return originator == Originator::System; }

        bool operator==(const Envelope &other) const noexcept {
            return originator == other.originator && persistent == other.persistent &&
                   network_type == other.network_type && type == other.type && body == other.body;
        }
    };

    // ─── Command body view ───────────────────────────────────────────────────────
    // Layout: [sub-command][pin/method index][value hi][value lo][...]
    struct CommandBody {
        u8 command = 0;
        u8 index = 0;
        u16 value = 0;

        static dp::Optional<CommandBody> parse(const Bytes &body) {
            if (body.size() < 2)
                return dp::nullopt;
            CommandBody cb;
            cb.command = body[0];
            cb.index = body[1];
            if (body.size() > 3) {
                cb.value = static_cast<u16>((static_cast<u16>(body[2]) << 8) | body[3]);
            }
            return cb;
        }
    };

} // namespace devlink
