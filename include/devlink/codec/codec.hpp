#pragma once

#include "../core/error.hpp"
#include "../core/message.hpp"
#include "../core/types.hpp"
#include <datapod/datapod.hpp>

namespace devlink {

    class WideRadio;

    // ─── Message codec (implemented by the application) ─────────────────────────
    // Packs outbound messages into wire envelopes and unpacks inbound ones. The
    // session layer never looks inside the bytes it produces.
    class Codec {
      public:
        virtual ~Codec() = default;

        // Network type tag stamped on subsequent outbound envelopes
        virtual void set_network_type(NetworkType type) = 0;

        virtual Bytes encode_ping() = 0;
        virtual Bytes encode_info() = 0;
        virtual Bytes encode_network_info() = 0;
        // radio is null unless a wide-area join has happened
        virtual Bytes encode_scan_info(const WideRadio *radio) = 0;
        virtual Bytes encode_battery_info(i32 level) = 0;
        virtual Bytes encode_ota_result(i32 code) = 0;
        virtual Bytes encode_pin_value(bool persistent, PinCommand command, u8 pin, u16 value) = 0;
        virtual Bytes encode_pin_values_variable(bool persistent, PinCommand command, u8 pin,
                                                 const Bytes &values) = 0;
        virtual Bytes encode_user_message(bool persistent, u8 type, const Bytes &body) = 0;

        virtual Result<Envelope> decode(const Bytes &raw) = 0;
    };

} // namespace devlink
