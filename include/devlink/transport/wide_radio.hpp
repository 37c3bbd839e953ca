#pragma once

#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../core/types.hpp"
#include "radio_socket.hpp"
#include <datapod/datapod.hpp>
#include <memory>
#include <utility>

namespace devlink {

    // ─── Activation mode ─────────────────────────────────────────────────────────
    enum class Activation : u8 { Abp, Otaa };

    // ─── Wide-area radio configuration ──────────────────────────────────────────
    // ABP uses dev_addr / nwk_skey / app_skey, OTAA uses dev_eui / app_eui / app_key.
    // Keys are hex strings; spaces are ignored.
    struct WideRadioConfig {
        Activation activation = Activation::Otaa;
        dp::String dev_addr;
        dp::String nwk_skey;
        dp::String app_skey;
        dp::String dev_eui;
        dp::String app_eui;
        dp::String app_key;
        u32 join_timeout_ms = DEFAULT_JOIN_TIMEOUT_MS;
        bool concentrator = false; // single-channel gateway channel plan

        static WideRadioConfig abp(dp::String addr, dp::String nwk, dp::String app) {
            WideRadioConfig c;
            c.activation = Activation::Abp;
            c.dev_addr = std::move(addr);
            c.nwk_skey = std::move(nwk);
            c.app_skey = std::move(app);
            return c;
        }
        static WideRadioConfig otaa(dp::String dev, dp::String app, dp::String key) {
            WideRadioConfig c;
            c.activation = Activation::Otaa;
            c.dev_eui = std::move(dev);
            c.app_eui = std::move(app);
            c.app_key = std::move(key);
            return c;
        }

        WideRadioConfig &join_timeout(u32 ms) {
            join_timeout_ms = ms;
            return *this;
        }
        WideRadioConfig &use_concentrator(bool enable) {
            concentrator = enable;
            return *this;
        }
    };

    // ─── Decoded join credentials ────────────────────────────────────────────────
    struct JoinRequest {
        Activation activation = Activation::Otaa;
        u32 dev_addr = 0;
        Bytes nwk_skey;
        Bytes app_skey;
        Bytes dev_eui;
        Bytes app_eui;
        Bytes app_key;
    };

    // ─── Wide-area radio (provided by the platform binding) ─────────────────────
    class WideRadio {
      public:
        virtual ~WideRadio() = default;

        virtual Result<void> join(const JoinRequest &request, u32 timeout_ms) = 0;
        virtual bool has_joined() const = 0;
        virtual Result<void> remove_channel(u8 index) = 0;
        virtual Result<void> add_channel(u8 index, u32 frequency_hz, u8 dr_min, u8 dr_max) = 0;
        // Returns null if the socket cannot be opened
        virtual std::unique_ptr<RadioSocket> open_socket(u8 data_rate) = 0;
    };

} // namespace devlink
