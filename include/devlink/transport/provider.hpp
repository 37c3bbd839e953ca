#pragma once

#include "narrow_radio.hpp"
#include "stream_client.hpp"
#include "wide_radio.hpp"
#include <memory>
#include <variant>

namespace devlink {

    // Selects the transport for Session::connect
    using TransportConfig = std::variant<StreamConfig, WideRadioConfig, NarrowRadioConfig>;

    // ─── Platform transport provider ─────────────────────────────────────────────
    // Each factory returns null when the hardware cannot provide the transport.
    class TransportProvider {
      public:
        virtual ~TransportProvider() = default;

        virtual std::unique_ptr<StreamClient> stream_client() = 0;
        virtual std::unique_ptr<WideRadio> wide_radio() = 0;
        virtual std::unique_ptr<NarrowRadio> narrow_radio() = 0;
    };

} // namespace devlink
