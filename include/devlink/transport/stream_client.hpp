#pragma once

#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../core/types.hpp"
#include <datapod/datapod.hpp>
#include <utility>

namespace devlink {

    // ─── Stream (publish/subscribe over IP) configuration ───────────────────────
    struct StreamConfig {
        dp::String host;
        bool reconnect = true;
        u32 join_timeout_ms = DEFAULT_JOIN_TIMEOUT_MS;
        u32 poll_interval_ms = STREAM_POLL_INTERVAL_MS;

        StreamConfig &broker(dp::String h) {
            host = std::move(h);
            return *this;
        }
        StreamConfig &auto_reconnect(bool enable) {
            reconnect = enable;
            return *this;
        }
        StreamConfig &join_timeout(u32 ms) {
            join_timeout_ms = ms;
            return *this;
        }
        StreamConfig &poll_interval(u32 ms) {
            poll_interval_ms = ms;
            return *this;
        }
    };

    // ─── Credentials presented to the broker ────────────────────────────────────
    struct StreamCredentials {
        dp::String client_id;
        dp::String user;
        dp::String password;
    };

    // ─── Stream client (provided by the platform binding) ───────────────────────
    // The binding brings up the IP link (e.g. station association) inside
    // connect() and fails with JoinTimeout or AuthFailure.
    class StreamClient {
      public:
        virtual ~StreamClient() = default;

        virtual Result<void> connect(const StreamConfig &config, const StreamCredentials &credentials) = 0;
        virtual Result<void> subscribe(const dp::String &topic) = 0;
        virtual Result<void> publish(const dp::String &topic, const Bytes &payload) = 0;
        // Returns at most one pending inbound payload
        virtual Result<dp::Optional<Bytes>> poll() = 0;
        virtual Result<void> disconnect() = 0;
    };

} // namespace devlink
