#pragma once

#include "../codec/codec.hpp"
#include "../console/console.hpp"
#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../core/message.hpp"
#include "../ota/updater.hpp"
#include "../pins/registry.hpp"
#include "reporter.hpp"
#include "session.hpp"
#include <atomic>
#include <chrono>
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <exception>
#include <functional>
#include <thread>

namespace devlink {
    namespace session {

        // ─── Dispatcher configuration ────────────────────────────────────────────────
        struct DispatchConfig {
            bool console_enabled = false; // console lines run local commands
            u32 ota_reboot_delay_ms = OTA_REBOOT_DELAY_MS;

            DispatchConfig &console(bool enable) {
                console_enabled = enable;
                return *this;
            }
            DispatchConfig &ota_reboot_delay(u32 ms) {
                ota_reboot_delay_ms = ms;
                return *this;
            }
        };

        using UserCallback = std::function<void(const Bytes &)>;

        // ─── Inbound message dispatcher ──────────────────────────────────────────────
        // System messages become device actions and replies; user messages go to the
        // application callback untouched. Failures are logged and never propagate
        // back into the receiver task.
        class Dispatcher {
            DispatchConfig config_;
            Codec &codec_;
            Session &session_;
            PinRegistry &pins_;
            Reporter &reporter_;

            std::atomic<bool> console_enabled_;
            ConsoleExecutor *console_ = nullptr;
            UserCallback user_callback_;
            ota::UpdaterFactory ota_factory_;

          public:
            Dispatcher(DispatchConfig config, Codec &codec, Session &session, PinRegistry &pins, Reporter &reporter)
                : config_(config), codec_(codec), session_(session), pins_(pins), reporter_(reporter),
                  console_enabled_(config.console_enabled) {}

            // Collaborators must be installed before connecting
            void set_user_callback(UserCallback callback) { user_callback_ = std::move(callback); }
            void set_console(ConsoleExecutor *console) { console_ = console; }
            void set_ota_factory(ota::UpdaterFactory factory) { ota_factory_ = std::move(factory); }

            void enable_console(bool enable) noexcept { console_enabled_.store(enable); }
            bool console_enabled() const noexcept { return console_enabled_.load(); }

            // ─── Entry point ─────────────────────────────────────────────────────────
            void on_message(const Bytes &raw) {
                auto decoded = codec_.decode(raw);
                if (!decoded.is_ok()) {
                    echo::category("devlink.dispatch")
                        .warn("dropping undecodable message (", raw.size(), " bytes): ", decoded.error().message);
                    return;
                }

                const Envelope &envelope = decoded.value();
                if (!envelope.is_system()) {
                    forward_user(raw);
                    return;
                }
                route_system(envelope);
            }

          private:
            // ─── System routing ──────────────────────────────────────────────────────
            void route_system(const Envelope &envelope) {
                auto type = static_cast<MessageType>(envelope.type);
                echo::category("devlink.dispatch")
                    .debug("system message ", to_string(type), " (", envelope.body.size(), " bytes)");

                switch (type) {
                case MessageType::Ping:
                    log_reply(reporter_.send_ping(), "ping");
                    break;
                case MessageType::Info:
                    log_reply(reporter_.send_info(), "info");
                    break;
                case MessageType::NetworkInfo:
                    log_reply(reporter_.send_network_info(), "network info");
                    break;
                case MessageType::ScanInfo:
                    log_reply(reporter_.send_scan_info(), "scan info");
                    break;
                case MessageType::BatteryInfo:
                    log_reply(reporter_.send_battery_info(), "battery info");
                    break;
                case MessageType::Ota:
                    handle_ota();
                    break;
                case MessageType::Command:
                    handle_command(envelope.body);
                    break;
                default:
                    echo::category("devlink.dispatch").debug("ignoring message type ", static_cast<int>(envelope.type));
                    break;
                }
            }

            void handle_ota() {
                if (!ota_factory_) {
                    echo::category("devlink.ota").warn("update requested but no updater is installed");
                    return;
                }
                auto updater = ota_factory_();
                if (!updater) {
                    echo::category("devlink.ota").error("updater factory returned nothing");
                    return;
                }

                if (session_.status() == ConnectionStatus::Disconnected) {
                    echo::category("devlink.ota").info("session disconnected, updater brings up its own link");
                    auto connected = updater->connect();
                    if (!connected.is_ok()) {
                        echo::category("devlink.ota").error("updater connect failed: ", connected.error().message);
                        return;
                    }
                }

                echo::category("devlink.ota").info("performing firmware update");
                i32 result = updater->update();
                log_reply(reporter_.send_ota_result(result), "update result");

                if (result == OTA_RESULT_APPLIED) {
                    if (config_.ota_reboot_delay_ms > 0)
                        std::this_thread::sleep_for(std::chrono::milliseconds(config_.ota_reboot_delay_ms));
                    echo::category("devlink.ota").info("rebooting into new firmware");
                    updater->reboot();
                }
            }

            // ─── Pin commands ────────────────────────────────────────────────────────
            void handle_command(const Bytes &body) {
                auto parsed = CommandBody::parse(body);
                if (!parsed.has_value()) {
                    echo::category("devlink.dispatch").warn("command body too short (", body.size(), " bytes)");
                    return;
                }
                const CommandBody &cmd = *parsed;
                PinIndex pin = cmd.index;

                switch (static_cast<PinCommand>(cmd.command)) {
                case PinCommand::PinMode:
                    break;

                case PinCommand::DigitalRead: {
                    auto recorded = pins_.pull_mode(pin);
                    PinPull pull = recorded.has_value() ? *recorded : PinPull::Up;
                    log_reply(reporter_.report_digital(pin, pull), "digital value");
                    break;
                }

                case PinCommand::DigitalWrite: {
                    auto written = pins_.write_digital(pin, cmd.value != 0 ? 1 : 0);
                    if (!written.is_ok()) {
                        echo::category("devlink.dispatch")
                            .warn("digital write on pin ", static_cast<int>(pin), " failed: ", written.error().message);
                    }
                    break;
                }

                case PinCommand::AnalogRead:
                    log_reply(reporter_.report_analog(pin), "analog value");
                    break;

                case PinCommand::AnalogWrite: {
                    auto written = pins_.write_pwm(pin, static_cast<u32>(cmd.value) * 100);
                    if (!written.is_ok()) {
                        echo::category("devlink.dispatch")
                            .warn("analog write on pin ", static_cast<int>(pin), " failed: ", written.error().message);
                    }
                    break;
                }

                case PinCommand::CustomMethod:
                    if (pin == CONSOLE_PIN) {
                        handle_console(body);
                    } else {
                        handle_custom_method(pin, body);
                    }
                    break;

                default:
                    echo::category("devlink.dispatch").debug("ignoring pin command ", static_cast<int>(cmd.command));
                    break;
                }
            }

            void handle_console(const Bytes &body) {
                if (!console_enabled_.load() || !console_)
                    return;

                dp::String line;
                for (usize i = 2; i < body.size(); ++i)
                    line += static_cast<char>(body[i]);

                dp::String reply;
                try {
                    auto output = console_->execute(line);
                    if (output.is_ok()) {
                        reply = std::move(output.value());
                    } else {
                        echo::category("devlink.console").warn("'", line, "' failed: ", output.error().message);
                        reply = output.error().message;
                    }
                } catch (const std::exception &e) {
                    echo::category("devlink.console").error("'", line, "' threw: ", e.what());
                    reply = e.what();
                }
                if (!reply.empty())
                    log_reply(reporter_.send_console(reply), "console output");
            }

            void handle_custom_method(MethodId id, const Bytes &body) {
                auto method = pins_.custom_method(id);
                if (!method) {
                    echo::category("devlink.dispatch")
                        .warn("custom method ", static_cast<int>(id), " called but nothing is registered");
                    return;
                }

                CustomParams params = parse_params(body);
                dp::Optional<CustomValues> returned;
                try {
                    returned = method(params);
                } catch (const std::exception &e) {
                    echo::category("devlink.dispatch")
                        .error("custom method ", static_cast<int>(id), " failed: ", e.what());
                    return;
                }

                if (returned.has_value() && !returned->empty()) {
                    log_reply(reporter_.report_custom_values(id, *returned), "custom method values");
                }
            }

            // Parameters follow the index as 3-byte groups: [hi, lo, pad]
            static CustomParams parse_params(const Bytes &body) {
                CustomParams params;
                usize slot = 0;
                for (usize i = 2; i + 1 < body.size(); i += 3) {
                    params[slot++] = static_cast<u16>((static_cast<u16>(body[i]) << 8) | body[i + 1]);
                }
                return params;
            }

            // ─── User messages ───────────────────────────────────────────────────────
            void forward_user(const Bytes &raw) {
                if (!user_callback_) {
                    echo::category("devlink.dispatch").debug("no user callback, dropping user message");
                    return;
                }
                try {
                    user_callback_(raw);
                } catch (const std::exception &e) {
                    echo::category("devlink.dispatch").error("user callback failed: ", e.what());
                }
            }

            static void log_reply(const Result<void> &sent, const char *what) {
                if (!sent.is_ok()) {
                    echo::category("devlink.dispatch").warn("could not send ", what, ": ", sent.error().message);
                }
            }
        };

    } // namespace session
} // namespace devlink
