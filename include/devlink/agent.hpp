#pragma once

#include "codec/codec.hpp"
#include "console/console.hpp"
#include "core/constants.hpp"
#include "core/error.hpp"
#include "hw/channel.hpp"
#include "ota/updater.hpp"
#include "pins/registry.hpp"
#include "session/dispatcher.hpp"
#include "session/reporter.hpp"
#include "session/session.hpp"
#include "transport/provider.hpp"
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <string>

namespace devlink {

    // ─── Agent configuration ─────────────────────────────────────────────────────
    struct AgentConfig {
        SessionConfig session;
        DispatchConfig dispatch;

        AgentConfig &device(dp::String id) {
            session.device(std::move(id));
            return *this;
        }
        AgentConfig &user(dp::String name) {
            session.user(std::move(name));
            return *this;
        }
        AgentConfig &console(bool enable) {
            dispatch.console(enable);
            return *this;
        }
        AgentConfig &ota_reboot_delay(u32 ms) {
            dispatch.ota_reboot_delay(ms);
            return *this;
        }
        AgentConfig &radio_poll_interval(u32 ms) {
            session.radio_poll_interval(ms);
            return *this;
        }
    };

    // ─── Device agent ────────────────────────────────────────────────────────────
    // Wires the session, the pin registry and the dispatcher together. Construct
    // one per process.
    //
    // Usage:
    //   Agent agent(AgentConfig{}.device("240ac4c7").user("me@example.com"), codec, platform, board);
    //   agent.register_custom_method(3, [](const CustomParams &p) { ... });
    //   agent.connect(StreamConfig{}.broker("mqtt.example.com"));
    //   agent.set_battery_level(87);
    class Agent {
        AgentConfig config_;
        Session session_;
        PinRegistry pins_;
        Reporter reporter_;
        Dispatcher dispatcher_;
        CommandConsole console_;

      public:
        Agent(AgentConfig config, Codec &codec, TransportProvider &transports, ChannelFactory &channels)
            : config_(std::move(config)), session_(config_.session, transports, codec), pins_(channels),
              reporter_(codec, session_, pins_), dispatcher_(config_.dispatch, codec, session_, pins_, reporter_) {
            session_.set_inbound_handler([this](const Bytes &raw) { dispatcher_.on_message(raw); });
            dispatcher_.set_console(&console_);
            register_builtin_commands();
        }

        // The receiver task calls into the dispatcher, so stop it first. A handler
        // that disconnected on its own may still be running; stop() joins it.
        ~Agent() {
            session_.disconnect();
            session_.stop();
        }

        Agent(const Agent &) = delete;
        Agent &operator=(const Agent &) = delete;

        // ─── Connection ──────────────────────────────────────────────────────────
        Result<void> connect(const TransportConfig &config) { return session_.connect(config); }
        Result<void> connect_stream(const StreamConfig &config) { return session_.connect_stream(config); }
        Result<void> connect_radio_wide(const WideRadioConfig &config) { return session_.connect_radio_wide(config); }
        Result<void> connect_radio_narrow(const NarrowRadioConfig &config) {
            return session_.connect_radio_narrow(config);
        }
        void disconnect() { session_.disconnect(); }

        ConnectionStatus status() const noexcept { return session_.status(); }
        bool is_connected() const noexcept { return session_.is_connected(); }

        // ─── Outbound ────────────────────────────────────────────────────────────
        Result<void> send(const Bytes &data, const dp::Optional<dp::String> &topic_suffix = dp::nullopt) {
            return session_.send(data, topic_suffix);
        }
        Result<void> send_ping() { return reporter_.send_ping(); }
        Result<void> send_info() { return reporter_.send_info(); }
        Result<void> send_network_info() { return reporter_.send_network_info(); }
        Result<void> send_scan_info() { return reporter_.send_scan_info(); }
        Result<void> send_battery_info() { return reporter_.send_battery_info(); }
        Result<void> send_ota_result(i32 code) { return reporter_.send_ota_result(code); }
        Result<void> send_user_message(bool persistent, u8 type, const Bytes &body) {
            return reporter_.send_user_message(persistent, type, body);
        }

        Result<void> report_digital(PinIndex pin, PinPull pull, bool persistent = false) {
            return reporter_.report_digital(pin, pull, persistent);
        }
        Result<void> report_analog(PinIndex pin, bool persistent = false) {
            return reporter_.report_analog(pin, persistent);
        }
        Result<void> report_custom_values(MethodId id, const CustomValues &values, bool persistent = false) {
            return reporter_.report_custom_values(id, values, persistent);
        }
        Result<void> report_custom_location(PinIndex pin, const dp::String &x, const dp::String &y) {
            return reporter_.report_custom_location(pin, x, y);
        }

        void set_battery_level(i32 level) noexcept { session_.set_battery_level(level); }
        i32 battery_level() const noexcept { return session_.battery_level(); }

        // ─── Pins and methods ────────────────────────────────────────────────────
        Result<void> configure_digital(PinIndex pin, PinDirection direction, PinPull pull) {
            return pins_.configure_digital(pin, direction, pull);
        }
        Result<void> configure_analog(PinIndex pin) { return pins_.configure_analog(pin); }
        Result<void> configure_pwm(PinIndex pin) { return pins_.configure_pwm(pin); }
        void register_custom_method(MethodId id, CustomMethod method) {
            pins_.register_custom_method(id, std::move(method));
        }

        // ─── Collaborators ───────────────────────────────────────────────────────
        void set_user_callback(UserCallback callback) { dispatcher_.set_user_callback(std::move(callback)); }
        void set_ota_factory(ota::UpdaterFactory factory) { dispatcher_.set_ota_factory(std::move(factory)); }

        // ─── Console ─────────────────────────────────────────────────────────────
        void enable_console(bool enable) noexcept { dispatcher_.enable_console(enable); }
        // Replaces the built-in command table; null restores it
        void set_console(ConsoleExecutor *executor) { dispatcher_.set_console(executor ? executor : &console_); }
        CommandConsole &console() noexcept { return console_; }

        // Mirrors local console output to the controller
        Result<void> console_write(const dp::String &text) { return reporter_.send_console(text); }

        // ─── Access ──────────────────────────────────────────────────────────────
        Session &session() noexcept { return session_; }
        PinRegistry &pins() noexcept { return pins_; }
        Dispatcher &dispatcher() noexcept { return dispatcher_; }
        const AgentConfig &config() const noexcept { return config_; }

      private:
        void register_builtin_commands() {
            console_.register_command("status", "connection status", [this](const CommandArgs &) {
                return Result<dp::String>::ok(dp::String(to_string(session_.status())));
            });

            console_.register_command("battery", "cached battery level", [this](const CommandArgs &) {
                i32 level = session_.battery_level();
                if (level == BATTERY_UNKNOWN)
                    return Result<dp::String>::ok(dp::String("unknown"));
                return Result<dp::String>::ok(dp::String(std::to_string(level)));
            });

            console_.register_command("pins", "configured virtual pins", [this](const CommandArgs &) {
                dp::String out;
                for (const auto &info : pins_.configured_pins()) {
                    if (!out.empty())
                        out += "\n";
                    out += dp::String(std::to_string(info.pin)) + ": " + to_string(info.kind);
                }
                if (out.empty())
                    out = "none";
                return Result<dp::String>::ok(out);
            });
        }
    };

} // namespace devlink
