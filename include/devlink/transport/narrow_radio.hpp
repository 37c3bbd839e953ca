#pragma once

#include "../core/error.hpp"
#include "../core/types.hpp"
#include "radio_socket.hpp"
#include <memory>

namespace devlink {

    // ─── Radio configuration zone ────────────────────────────────────────────────
    enum class RadioZone : u8 { Rcz1 = 1, Rcz2 = 2, Rcz3 = 3, Rcz4 = 4 };

    // ─── Ultra-narrowband radio configuration ───────────────────────────────────
    struct NarrowRadioConfig {
        RadioZone zone = RadioZone::Rcz1;

        NarrowRadioConfig &region(RadioZone z) {
            zone = z;
            return *this;
        }
    };

    // ─── Ultra-narrowband radio (provided by the platform binding) ──────────────
    class NarrowRadio {
      public:
        virtual ~NarrowRadio() = default;

        virtual Result<void> init(const NarrowRadioConfig &config) = 0;
        // rx_enabled=false opens an uplink-only socket. Returns null on failure.
        virtual std::unique_ptr<RadioSocket> open_socket(bool rx_enabled) = 0;
    };

} // namespace devlink
