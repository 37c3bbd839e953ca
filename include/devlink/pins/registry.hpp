#pragma once

#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../core/types.hpp"
#include "../hw/channel.hpp"
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace devlink {
    namespace pins {

        // ─── Custom method types ─────────────────────────────────────────────────────
        using CustomParams = dp::Map<usize, u16>; // slot index -> value
        using CustomValues = dp::Vector<u16>;
        using CustomMethod = std::function<dp::Optional<CustomValues>(const CustomParams &)>;

        struct PinInfo {
            PinIndex pin = 0;
            ChannelKind kind = ChannelKind::Digital;
        };

        // ─── Virtual pin and custom method registry ─────────────────────────────────
        // Channels are created through the factory on first use and kept until the
        // pin is reconfigured. Shared by the receiver task and foreground callers.
        class PinRegistry {
            ChannelFactory &factory_;
            mutable std::mutex mutex_;
            dp::Map<PinIndex, std::shared_ptr<Channel>> channels_;
            dp::Map<PinIndex, PinPull> pulls_;
            dp::Map<MethodId, CustomMethod> methods_;

          public:
            explicit PinRegistry(ChannelFactory &factory) : factory_(factory) {}

            PinRegistry(const PinRegistry &) = delete;
            PinRegistry &operator=(const PinRegistry &) = delete;

            // ─── Explicit configuration (replaces any prior channel) ─────────────────
            Result<void> configure_digital(PinIndex pin, PinDirection direction, PinPull pull) {
                if (pin == CONSOLE_PIN)
                    return Result<void>::err(reserved_pin());
                auto channel = factory_.make_digital(pin, direction, pull);
                if (!channel) {
                    return Result<void>::err(Error::hardware_fault("cannot create digital channel"));
                }
                std::lock_guard<std::mutex> lock(mutex_);
                channels_[pin] = std::shared_ptr<Channel>(std::move(channel));
                pulls_[pin] = pull;
                echo::category("devlink.pins").debug("pin ", static_cast<int>(pin), " configured as digital");
                return {};
            }

            Result<void> configure_analog(PinIndex pin) {
                if (pin == CONSOLE_PIN)
                    return Result<void>::err(reserved_pin());
                auto channel = factory_.make_analog(pin);
                if (!channel) {
                    return Result<void>::err(Error::hardware_fault("cannot create analog channel"));
                }
                std::lock_guard<std::mutex> lock(mutex_);
                channels_[pin] = std::shared_ptr<Channel>(std::move(channel));
                forget_pull(pin);
                echo::category("devlink.pins").debug("pin ", static_cast<int>(pin), " configured as analog");
                return {};
            }

            Result<void> configure_pwm(PinIndex pin) {
                if (pin == CONSOLE_PIN)
                    return Result<void>::err(reserved_pin());
                auto channel = factory_.make_pwm(pin);
                if (!channel) {
                    return Result<void>::err(Error::hardware_fault("cannot create pwm channel"));
                }
                std::lock_guard<std::mutex> lock(mutex_);
                channels_[pin] = std::shared_ptr<Channel>(std::move(channel));
                forget_pull(pin);
                echo::category("devlink.pins").debug("pin ", static_cast<int>(pin), " configured as pwm");
                return {};
            }

            // ─── Channel operations (configure lazily on first use) ──────────────────
            Result<u8> read_digital(PinIndex pin, PinPull pull) {
                auto channel =
                    channel_or_configure(pin, [&] { return configure_digital(pin, PinDirection::Input, pull); });
                if (!channel.is_ok())
                    return Result<u8>::err(channel.error());
                auto *digital = channel.value()->as_digital();
                if (!digital)
                    return Result<u8>::err(wrong_kind(pin, channel.value()->kind()));
                return Result<u8>::ok(digital->level());
            }

            Result<void> write_digital(PinIndex pin, u8 level) {
                auto channel = channel_or_configure(
                    pin, [&] { return configure_digital(pin, PinDirection::Output, PinPull::None); });
                if (!channel.is_ok())
                    return Result<void>::err(channel.error());
                auto *digital = channel.value()->as_digital();
                if (!digital)
                    return Result<void>::err(wrong_kind(pin, channel.value()->kind()));
                digital->set_level(level);
                return {};
            }

            Result<u16> read_analog(PinIndex pin) {
                auto channel = channel_or_configure(pin, [&] { return configure_analog(pin); });
                if (!channel.is_ok())
                    return Result<u16>::err(channel.error());
                auto *analog = channel.value()->as_analog();
                if (!analog)
                    return Result<u16>::err(wrong_kind(pin, channel.value()->kind()));
                return Result<u16>::ok(analog->sample());
            }

            Result<void> write_pwm(PinIndex pin, u32 duty) {
                auto channel = channel_or_configure(pin, [&] { return configure_pwm(pin); });
                if (!channel.is_ok())
                    return Result<void>::err(channel.error());
                auto *pwm = channel.value()->as_pwm();
                if (!pwm)
                    return Result<void>::err(wrong_kind(pin, channel.value()->kind()));
                pwm->set_duty_cycle(duty);
                return {};
            }

            // ─── Lookup ──────────────────────────────────────────────────────────────
            std::shared_ptr<Channel> channel(PinIndex pin) const {
                std::lock_guard<std::mutex> lock(mutex_);
                auto it = channels_.find(pin);
                if (it == channels_.end())
                    return nullptr;
                return it->second;
            }

            dp::Optional<PinPull> pull_mode(PinIndex pin) const {
                std::lock_guard<std::mutex> lock(mutex_);
                auto it = pulls_.find(pin);
                if (it == pulls_.end())
                    return dp::nullopt;
                return it->second;
            }

            dp::Vector<PinInfo> configured_pins() const {
                std::lock_guard<std::mutex> lock(mutex_);
                dp::Vector<PinInfo> out;
                for (const auto &[pin, channel] : channels_) {
                    out.push_back({pin, channel->kind()});
                }
                return out;
            }

            // ─── Custom methods ──────────────────────────────────────────────────────
            void register_custom_method(MethodId id, CustomMethod method) {
                std::lock_guard<std::mutex> lock(mutex_);
                methods_[id] = std::move(method);
            }

            // Empty function when nothing is registered for id
            CustomMethod custom_method(MethodId id) const {
                std::lock_guard<std::mutex> lock(mutex_);
                auto it = methods_.find(id);
                if (it == methods_.end())
                    return {};
                return it->second;
            }

          private:
            template <typename Configure>
            Result<std::shared_ptr<Channel>> channel_or_configure(PinIndex pin, Configure &&configure) {
                auto existing = channel(pin);
                if (existing)
                    return Result<std::shared_ptr<Channel>>::ok(existing);
                auto result = configure();
                if (!result.is_ok())
                    return Result<std::shared_ptr<Channel>>::err(result.error());
                return Result<std::shared_ptr<Channel>>::ok(channel(pin));
            }

            // Pull modes only describe digital channels
            void forget_pull(PinIndex pin) {
                auto it = pulls_.find(pin);
                if (it != pulls_.end())
                    pulls_.erase(it);
            }

            static Error reserved_pin() {
                return Error::invalid_data("pin " + dp::String(std::to_string(CONSOLE_PIN)) +
                                           " is reserved for the console");
            }

            static Error wrong_kind(PinIndex pin, ChannelKind kind) {
                return Error::invalid_state("pin " + dp::String(std::to_string(pin)) + " is configured as " +
                                            to_string(kind));
            }
        };

    } // namespace pins
    using namespace pins;
} // namespace devlink
