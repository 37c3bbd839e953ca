#pragma once

#include "../codec/codec.hpp"
#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../core/message.hpp"
#include "../pins/registry.hpp"
#include "session.hpp"
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>

namespace devlink {
    namespace session {

        // ─── Outbound messages ───────────────────────────────────────────────────────
        // Encodes through the codec and sends through the session. Pin reports
        // configure their pin on first use.
        class Reporter {
            Codec &codec_;
            Session &session_;
            PinRegistry &pins_;

          public:
            Reporter(Codec &codec, Session &session, PinRegistry &pins)
                : codec_(codec), session_(session), pins_(pins) {}

            Result<void> send_ping() { return session_.send(codec_.encode_ping()); }
            Result<void> send_info() { return session_.send(codec_.encode_info()); }
            Result<void> send_network_info() { return session_.send(codec_.encode_network_info()); }
            Result<void> send_scan_info() {
                auto radio = session_.wide_radio();
                return session_.send(codec_.encode_scan_info(radio.get()));
            }
            Result<void> send_battery_info() {
                return session_.send(codec_.encode_battery_info(session_.battery_level()));
            }

            Result<void> send_ota_result(i32 code) {
                echo::category("devlink.ota").info("sending update result ", code);
                return session_.send(codec_.encode_ota_result(code), dp::String(OTA_TOPIC_SUFFIX));
            }

            Result<void> send_user_message(bool persistent, u8 type, const Bytes &body) {
                return session_.send(codec_.encode_user_message(persistent, type, body));
            }

            // Replies carry the write command code: the controller applies them as updates
            Result<void> report_digital(PinIndex pin, PinPull pull, bool persistent = false) {
                auto level = pins_.read_digital(pin, pull);
                if (!level.is_ok()) {
                    echo::category("devlink.pins")
                        .warn("digital read on pin ", static_cast<int>(pin), " failed: ", level.error().message);
                    return Result<void>::err(level.error());
                }
                return session_.send(codec_.encode_pin_value(persistent, PinCommand::DigitalWrite, pin, level.value()));
            }

            Result<void> report_analog(PinIndex pin, bool persistent = false) {
                auto sample = pins_.read_analog(pin);
                if (!sample.is_ok()) {
                    echo::category("devlink.pins")
                        .warn("analog read on pin ", static_cast<int>(pin), " failed: ", sample.error().message);
                    return Result<void>::err(sample.error());
                }
                return session_.send(
                    codec_.encode_pin_value(persistent, PinCommand::AnalogWrite, pin, sample.value()));
            }

            // Each value travels as [hi, lo, 0x00]
            Result<void> report_custom_values(MethodId id, const CustomValues &values, bool persistent = false) {
                Bytes packed;
                for (u16 v : values) {
                    packed.push_back(static_cast<u8>((v >> 8) & 0xFF));
                    packed.push_back(static_cast<u8>(v & 0xFF));
                    packed.push_back(0x00);
                }
                return session_.send(codec_.encode_pin_values_variable(persistent, PinCommand::CustomMethod, id, packed));
            }

            Result<void> report_custom_location(PinIndex pin, const dp::String &x, const dp::String &y) {
                dp::String json = "{\"x\": " + x + ", \"y\": " + y + "}";
                return session_.send(
                    codec_.encode_pin_values_variable(false, PinCommand::CustomLocation, pin, to_bytes(json)));
            }

            // Text over the console channel
            Result<void> send_console(const dp::String &text) {
                return session_.send(
                    codec_.encode_pin_values_variable(false, PinCommand::CustomMethod, CONSOLE_PIN, to_bytes(text)));
            }

          private:
            static Bytes to_bytes(const dp::String &text) {
                Bytes out;
                out.reserve(text.size());
                for (usize i = 0; i < text.size(); ++i)
                    out.push_back(static_cast<u8>(text[i]));
                return out;
            }
        };

    } // namespace session
} // namespace devlink
