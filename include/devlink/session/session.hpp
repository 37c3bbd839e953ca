#pragma once

#include "../codec/codec.hpp"
#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../core/message.hpp"
#include "../core/types.hpp"
#include "../transport/provider.hpp"
#include "../transport/radio_socket.hpp"
#include "../util/hex.hpp"
#include "../util/state_machine.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>
#include <variant>

namespace devlink {
    namespace session {

        // ─── Connection status ───────────────────────────────────────────────────────
        enum class ConnectionStatus : u8 { Disconnected, ConnectedStream, ConnectedRadioWide, ConnectedRadioNarrow };

        inline const char *to_string(ConnectionStatus status) noexcept {
            switch (status) {
            case ConnectionStatus::Disconnected:
                return "disconnected";
            case ConnectionStatus::ConnectedStream:
                return "connected (stream)";
            case ConnectionStatus::ConnectedRadioWide:
                return "connected (radio wide)";
            case ConnectionStatus::ConnectedRadioNarrow:
                return "connected (radio narrow)";
            }
            return "unknown";
        }

        // ─── Session configuration ───────────────────────────────────────────────────
        struct SessionConfig {
            dp::String device_id;
            dp::String user_name;
            u32 radio_poll_interval_ms = RADIO_POLL_INTERVAL_MS;
            usize radio_recv_max = RADIO_RECV_MAX;

            SessionConfig &device(dp::String id) {
                device_id = std::move(id);
                return *this;
            }
            SessionConfig &user(dp::String name) {
                user_name = std::move(name);
                return *this;
            }
            SessionConfig &radio_poll_interval(u32 ms) {
                radio_poll_interval_ms = ms;
                return *this;
            }
            SessionConfig &radio_recv_limit(usize bytes) {
                radio_recv_max = bytes;
                return *this;
            }
        };

        using InboundHandler = std::function<void(const Bytes &)>;

        // ─── Session: one logical connection to the controller ─────────────────────
        // Owns the active transport (at most one) and the background receiver task.
        // connect/disconnect are serialized with each other; send() may be called
        // from any thread, including from inside the inbound handler.
        //
        // Status listeners run with the lifecycle lock held and must not call
        // connect() or disconnect().
        class Session {
            SessionConfig config_;
            TransportProvider &provider_;
            Codec &codec_;
            StateMachine<ConnectionStatus> status_{ConnectionStatus::Disconnected};
            dp::String uplink_topic_;
            dp::String downlink_topic_;

            std::mutex lifecycle_mutex_;

            // Stream transport
            std::mutex stream_mutex_;
            std::unique_ptr<StreamClient> stream_;
            u32 stream_poll_interval_ms_ = STREAM_POLL_INTERVAL_MS;

            // Radio transports
            mutable std::mutex radio_mutex_;
            std::shared_ptr<WideRadio> wide_radio_;
            GuardedSocket wide_socket_;
            std::unique_ptr<NarrowRadio> narrow_radio_;
            GuardedSocket narrow_socket_;

            // Receiver task
            std::thread receiver_;
            std::atomic<std::thread::id> rx_thread_id_{};
            std::atomic<bool> rx_running_{false};
            std::atomic<u32> rx_generation_{0};
            std::mutex wait_mutex_;
            std::condition_variable wait_cv_;
            InboundHandler inbound_;

            std::atomic<i32> battery_level_{BATTERY_UNKNOWN};

          public:
            Session(SessionConfig config, TransportProvider &provider, Codec &codec)
                : config_(std::move(config)), provider_(provider), codec_(codec) {
                uplink_topic_ = dp::String(1, UPLINK_PREFIX) + config_.device_id;
                downlink_topic_ = dp::String(1, DOWNLINK_PREFIX) + config_.device_id;
            }

            ~Session() {
                disconnect();
                stop();
            }

            Session(const Session &) = delete;
            Session &operator=(const Session &) = delete;

            // Must be set before connecting
            void set_inbound_handler(InboundHandler handler) { inbound_ = std::move(handler); }

            // ─── Connect ─────────────────────────────────────────────────────────────
            Result<void> connect(const TransportConfig &config) {
                if (auto *stream = std::get_if<StreamConfig>(&config))
                    return connect_stream(*stream);
                if (auto *wide = std::get_if<WideRadioConfig>(&config))
                    return connect_radio_wide(*wide);
                return connect_radio_narrow(std::get<NarrowRadioConfig>(config));
            }

            Result<void> connect_stream(const StreamConfig &config) {
                std::lock_guard<std::mutex> lock(lifecycle_mutex_);
                if (!status_.is(ConnectionStatus::Disconnected)) {
                    echo::category("devlink.session").error("connect_stream: connection already exists");
                    return Result<void>::err(Error::already_connected());
                }

                auto client = provider_.stream_client();
                if (!client) {
                    echo::category("devlink.session").error("this device does not support stream connections");
                    return Result<void>::err(Error::unsupported_transport("stream transport not available"));
                }

                StreamCredentials credentials{config_.device_id, config_.user_name, config_.device_id};
                auto connected = client->connect(config, credentials);
                if (!connected.is_ok()) {
                    echo::category("devlink.session").error("stream connect failed: ", connected.error().message);
                    return connected;
                }

                auto subscribed = client->subscribe(downlink_topic_);
                if (!subscribed.is_ok()) {
                    echo::category("devlink.session")
                        .error("subscribe to ", downlink_topic_, " failed: ", subscribed.error().message);
                    auto closed = client->disconnect();
                    if (!closed.is_ok())
                        echo::category("devlink.session").warn("error disconnecting: ", closed.error().message);
                    return subscribed;
                }

                {
                    std::lock_guard<std::mutex> stream_lock(stream_mutex_);
                    stream_ = std::move(client);
                }
                stream_poll_interval_ms_ = config.poll_interval_ms;
                codec_.set_network_type(NetworkType::Wifi);
                status_.transition(ConnectionStatus::ConnectedStream);
                start_receiver([this](u32 generation) { stream_receive_loop(generation); });
                echo::category("devlink.session").info("connected to ", config.host, " as ", config_.device_id);
                return {};
            }

            Result<void> connect_radio_wide(const WideRadioConfig &config) {
                std::lock_guard<std::mutex> lock(lifecycle_mutex_);
                if (!status_.is(ConnectionStatus::Disconnected)) {
                    echo::category("devlink.session").error("connect_radio_wide: connection already exists");
                    return Result<void>::err(Error::already_connected());
                }

                auto radio = provider_.wide_radio();
                if (!radio) {
                    echo::category("devlink.session").error("this device does not support wide-area radio");
                    return Result<void>::err(Error::unsupported_transport("wide-area radio not available"));
                }

                auto request = make_join_request(config);
                if (!request.is_ok()) {
                    echo::category("devlink.session").error("invalid radio keys: ", request.error().message);
                    return Result<void>::err(request.error());
                }

                echo::category("devlink.session")
                    .info("joining radio (", config.activation == Activation::Abp ? "ABP" : "OTAA", ") for ",
                          config.join_timeout_ms, " ms");
                auto joined = radio->join(request.value(), config.join_timeout_ms);
                if (!joined.is_ok()) {
                    echo::category("devlink.session").error("radio join failed: ", joined.error().message);
                    return joined;
                }

                if (config.concentrator) {
                    auto plan = apply_concentrator_plan(*radio);
                    if (!plan.is_ok()) {
                        echo::category("devlink.session").error("channel plan failed: ", plan.error().message);
                        return plan;
                    }
                }

                auto socket = radio->open_socket(RADIO_SOCKET_DR);
                if (!socket) {
                    echo::category("devlink.session").error("cannot open radio socket");
                    return Result<void>::err(Error::transport_io("cannot open radio socket"));
                }

                wide_socket_.reset(std::move(socket));
                {
                    std::lock_guard<std::mutex> radio_lock(radio_mutex_);
                    wide_radio_ = std::move(radio);
                }
                codec_.set_network_type(NetworkType::LoRa);
                status_.transition(ConnectionStatus::ConnectedRadioWide);
                start_receiver([this](u32 generation) { radio_receive_loop(generation); });
                echo::category("devlink.session").info("connected using wide-area radio");
                return {};
            }

            Result<void> connect_radio_narrow(const NarrowRadioConfig &config) {
                std::lock_guard<std::mutex> lock(lifecycle_mutex_);
                if (!status_.is(ConnectionStatus::Disconnected)) {
                    echo::category("devlink.session").error("connect_radio_narrow: connection already exists");
                    return Result<void>::err(Error::already_connected());
                }

                auto radio = provider_.narrow_radio();
                if (!radio) {
                    echo::category("devlink.session").error("this device does not support narrowband radio");
                    return Result<void>::err(Error::unsupported_transport("narrowband radio not available"));
                }

                auto init = radio->init(config);
                if (!init.is_ok()) {
                    echo::category("devlink.session").error("narrowband init failed: ", init.error().message);
                    return init;
                }

                auto socket = radio->open_socket(false);
                if (!socket) {
                    echo::category("devlink.session").error("cannot open narrowband socket");
                    return Result<void>::err(Error::transport_io("cannot open narrowband socket"));
                }
                auto blocking = socket->set_blocking(true);
                if (!blocking.is_ok()) {
                    auto closed = socket->close();
                    if (!closed.is_ok())
                        echo::category("devlink.session").warn("error closing socket: ", closed.error().message);
                    return blocking;
                }

                narrow_socket_.reset(std::move(socket));
                narrow_radio_ = std::move(radio);
                codec_.set_network_type(NetworkType::Sigfox);
                status_.transition(ConnectionStatus::ConnectedRadioNarrow);
                echo::category("devlink.session").info("connected using narrowband radio, uplink only");
                return {};
            }

            // ─── Disconnect (idempotent, best effort) ────────────────────────────────
            void disconnect() {
                std::unique_lock<std::mutex> lock(lifecycle_mutex_, std::defer_lock);
                if (!lock_lifecycle(lock))
                    return;
                ConnectionStatus current = status_.state();
                if (current == ConnectionStatus::Disconnected) {
                    echo::category("devlink.session").debug("already disconnected");
                    return;
                }

                stop_receiver();

                Result<void> closed;
                switch (current) {
                case ConnectionStatus::ConnectedStream: {
                    std::lock_guard<std::mutex> stream_lock(stream_mutex_);
                    if (stream_)
                        closed = stream_->disconnect();
                    stream_.reset();
                    break;
                }
                case ConnectionStatus::ConnectedRadioWide:
                    closed = wide_socket_.close();
                    {
                        std::lock_guard<std::mutex> radio_lock(radio_mutex_);
                        wide_radio_.reset();
                    }
                    break;
                case ConnectionStatus::ConnectedRadioNarrow:
                    closed = narrow_socket_.close();
                    narrow_radio_.reset();
                    break;
                case ConnectionStatus::Disconnected:
                    break;
                }
                if (!closed.is_ok()) {
                    echo::category("devlink.session").error("error disconnecting: ", closed.error().message);
                }

                status_.transition(ConnectionStatus::Disconnected);
                echo::category("devlink.session").info("disconnected");
            }

            // Stops and joins the receiver task without touching the transport.
            // Owners whose members the inbound handler reaches call this before
            // those members are destroyed.
            void stop() {
                std::unique_lock<std::mutex> lock(lifecycle_mutex_, std::defer_lock);
                if (!lock_lifecycle(lock))
                    return;
                stop_receiver();
                reap_receiver();
            }

            // ─── Send (routes by current status) ─────────────────────────────────────
            Result<void> send(const Bytes &data, const dp::Optional<dp::String> &topic_suffix = dp::nullopt) {
                Result<void> result;
                switch (status_.state()) {
                case ConnectionStatus::ConnectedStream: {
                    dp::String topic = uplink_topic_;
                    if (topic_suffix.has_value())
                        topic += "/" + *topic_suffix;
                    std::lock_guard<std::mutex> stream_lock(stream_mutex_);
                    if (!stream_) {
                        result = Result<void>::err(Error::not_connected());
                        break;
                    }
                    echo::category("devlink.session").trace("publishing ", data.size(), " bytes on ", topic);
                    result = stream_->publish(topic, data);
                    break;
                }
                case ConnectionStatus::ConnectedRadioWide:
                    result = wide_socket_.send_blocking(data);
                    break;
                case ConnectionStatus::ConnectedRadioNarrow:
                    if (data.size() > NARROW_MAX_PAYLOAD) {
                        echo::category("devlink.session")
                            .warn("message not sent, narrowband supports ", NARROW_MAX_PAYLOAD, " byte messages");
                        return Result<void>::err(Error::payload_too_large(data.size(), NARROW_MAX_PAYLOAD));
                    }
                    result = narrow_socket_.send(data);
                    break;
                case ConnectionStatus::Disconnected:
                    echo::category("devlink.session").error("sending without a connection");
                    return Result<void>::err(Error::not_connected());
                }

                if (!result.is_ok()) {
                    echo::category("devlink.session").error("error sending message: ", result.error().message);
                }
                return result;
            }

            // ─── State ───────────────────────────────────────────────────────────────
            ConnectionStatus status() const noexcept { return status_.state(); }
            bool is_connected() const noexcept { return !status_.is(ConnectionStatus::Disconnected); }
            Event<ConnectionStatus, ConnectionStatus> &on_status_change() noexcept { return status_.on_transition; }

            const SessionConfig &config() const noexcept { return config_; }
            const dp::String &uplink_topic() const noexcept { return uplink_topic_; }
            const dp::String &downlink_topic() const noexcept { return downlink_topic_; }

            // Non-null only while connected over a joined wide-area radio. The
            // returned handle keeps the radio alive across a concurrent disconnect.
            std::shared_ptr<const WideRadio> wide_radio() const {
                std::lock_guard<std::mutex> radio_lock(radio_mutex_);
                if (!status_.is(ConnectionStatus::ConnectedRadioWide) || !wide_radio_)
                    return nullptr;
                return wide_radio_->has_joined() ? wide_radio_ : nullptr;
            }

            void set_battery_level(i32 level) noexcept { battery_level_.store(level); }
            i32 battery_level() const noexcept { return battery_level_.load(); }

          private:
            // ─── Receiver task ───────────────────────────────────────────────────────
            template <typename Loop> void start_receiver(Loop &&loop) {
                reap_receiver();
                u32 generation = rx_generation_.fetch_add(1) + 1;
                rx_running_.store(true);
                receiver_ = std::thread([this, generation, body = std::forward<Loop>(loop)]() mutable {
                    rx_thread_id_.store(std::this_thread::get_id());
                    body(generation);
                });
            }

            bool on_receiver_thread() const noexcept { return rx_thread_id_.load() == std::this_thread::get_id(); }

            // Foreground callers simply block. The receiver task must not, since a
            // foreground disconnect holds the lock while it joins the receiver;
            // once the receiver sees itself stopped it gives up instead.
            bool lock_lifecycle(std::unique_lock<std::mutex> &lock) {
                if (!on_receiver_thread()) {
                    lock.lock();
                    return true;
                }
                while (!lock.try_lock()) {
                    if (!rx_running_.load()) {
                        echo::category("devlink.session").debug("disconnect already in progress");
                        return false;
                    }
                    std::this_thread::sleep_for(std::chrono::milliseconds(1));
                }
                return true;
            }

            // A receiver left over from an earlier connection sees a stale generation
            bool receiving(u32 generation) const noexcept {
                return rx_running_.load() && rx_generation_.load() == generation;
            }

            void stop_receiver() {
                {
                    std::lock_guard<std::mutex> wait_lock(wait_mutex_);
                    rx_running_.store(false);
                }
                wait_cv_.notify_all();
                // From the inbound handler the loop exits on its next check and is
                // joined by the next connect, by stop() or by the destructor
                if (receiver_.joinable() && receiver_.get_id() != std::this_thread::get_id())
                    receiver_.join();
            }

            void reap_receiver() {
                if (!receiver_.joinable())
                    return;
                if (receiver_.get_id() == std::this_thread::get_id()) {
                    receiver_.detach();
                } else {
                    receiver_.join();
                }
                rx_thread_id_.store(std::thread::id{});
            }

            // Sleeps for the poll interval; returns false once the receiver is stopped
            bool wait_next_poll(u32 generation, u32 interval_ms) {
                std::unique_lock<std::mutex> wait_lock(wait_mutex_);
                wait_cv_.wait_for(wait_lock, std::chrono::milliseconds(interval_ms),
                                  [this, generation] { return !receiving(generation); });
                return receiving(generation);
            }

            void stream_receive_loop(u32 generation) {
                echo::category("devlink.session.rx").debug("stream receiver started");
                while (receiving(generation) && status_.is(ConnectionStatus::ConnectedStream)) {
                    dp::Optional<Bytes> message;
                    {
                        std::lock_guard<std::mutex> stream_lock(stream_mutex_);
                        if (!stream_)
                            break;
                        auto polled = stream_->poll();
                        if (polled.is_ok()) {
                            message = std::move(polled.value());
                        } else {
                            echo::category("devlink.session.rx")
                                .warn("error receiving from stream: ", polled.error().message);
                        }
                    }
                    if (message.has_value()) {
                        deliver(*message);
                        continue;
                    }
                    if (!wait_next_poll(generation, stream_poll_interval_ms_))
                        break;
                }
                echo::category("devlink.session.rx").debug("stream receiver stopped");
            }

            void radio_receive_loop(u32 generation) {
                echo::category("devlink.session.rx").debug("radio receiver started");
                while (receiving(generation) && status_.is(ConnectionStatus::ConnectedRadioWide)) {
                    auto received = wide_socket_.try_recv(config_.radio_recv_max);
                    if (!received.is_ok()) {
                        echo::category("devlink.session.rx")
                            .warn("error receiving from radio: ", received.error().message);
                    } else if (!received.value().empty()) {
                        deliver(received.value());
                    }
                    if (!wait_next_poll(generation, config_.radio_poll_interval_ms))
                        break;
                }
                echo::category("devlink.session.rx").debug("radio receiver stopped");
            }

            void deliver(const Bytes &message) {
                echo::category("devlink.session.rx").trace("received ", message.size(), " bytes");
                if (!inbound_)
                    return;
                try {
                    inbound_(message);
                } catch (const std::exception &e) {
                    echo::category("devlink.session.rx").error("inbound handler failed: ", e.what());
                }
            }

            // ─── Radio helpers ───────────────────────────────────────────────────────
            static Result<JoinRequest> make_join_request(const WideRadioConfig &config) {
                JoinRequest request;
                request.activation = config.activation;

                if (config.activation == Activation::Abp) {
                    auto addr = parse_hex_u32(config.dev_addr);
                    if (!addr.is_ok())
                        return Result<JoinRequest>::err(addr.error());
                    auto nwk = parse_hex(config.nwk_skey);
                    if (!nwk.is_ok())
                        return Result<JoinRequest>::err(nwk.error());
                    auto app = parse_hex(config.app_skey);
                    if (!app.is_ok())
                        return Result<JoinRequest>::err(app.error());
                    request.dev_addr = addr.value();
                    request.nwk_skey = std::move(nwk.value());
                    request.app_skey = std::move(app.value());
                } else {
                    auto dev = parse_hex(config.dev_eui);
                    if (!dev.is_ok())
                        return Result<JoinRequest>::err(dev.error());
                    auto app = parse_hex(config.app_eui);
                    if (!app.is_ok())
                        return Result<JoinRequest>::err(app.error());
                    auto key = parse_hex(config.app_key);
                    if (!key.is_ok())
                        return Result<JoinRequest>::err(key.error());
                    request.dev_eui = std::move(dev.value());
                    request.app_eui = std::move(app.value());
                    request.app_key = std::move(key.value());
                }
                return Result<JoinRequest>::ok(std::move(request));
            }

            // Single-channel concentrators listen on one frequency only
            static Result<void> apply_concentrator_plan(WideRadio &radio) {
                for (u8 ch = CONCENTRATOR_CHANNELS; ch < RADIO_MAX_CHANNELS; ++ch) {
                    auto removed = radio.remove_channel(ch);
                    if (!removed.is_ok())
                        return removed;
                }
                for (u8 ch = 0; ch < CONCENTRATOR_CHANNELS; ++ch) {
                    auto added = radio.add_channel(ch, CONCENTRATOR_FREQUENCY_HZ, RADIO_DR_MIN, RADIO_DR_MAX);
                    if (!added.is_ok())
                        return added;
                }
                echo::category("devlink.session").debug("concentrator channel plan applied");
                return {};
            }
        };

    } // namespace session
    using namespace session;
} // namespace devlink
