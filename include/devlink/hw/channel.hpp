#pragma once

#include "../core/error.hpp"
#include "../core/types.hpp"
#include <memory>

namespace devlink {
    namespace hw {

        enum class ChannelKind : u8 { Digital, Analog, Pwm };
        enum class PinDirection : u8 { Input, Output, OpenDrain };
        enum class PinPull : u8 { None, Up, Down };

        inline const char *to_string(ChannelKind kind) noexcept {
            switch (kind) {
            case ChannelKind::Digital:
                return "digital";
            case ChannelKind::Analog:
                return "analog";
            case ChannelKind::Pwm:
                return "pwm";
            }
            return "unknown";
        }

        class DigitalChannel;
        class AnalogChannel;
        class PwmChannel;

        // ─── Hardware channel backing a virtual pin ──────────────────────────────────
        class Channel {
          public:
            virtual ~Channel() = default;

            virtual ChannelKind kind() const noexcept = 0;

            virtual DigitalChannel *as_digital() noexcept { return nullptr; }
            virtual AnalogChannel *as_analog() noexcept { return nullptr; }
            virtual PwmChannel *as_pwm() noexcept { return nullptr; }
        };

        class DigitalChannel : public Channel {
          public:
            ChannelKind kind() const noexcept override { return ChannelKind::Digital; }
            DigitalChannel *as_digital() noexcept override { return this; }

            virtual u8 level() = 0;
            virtual void set_level(u8 level) = 0;
        };

        class AnalogChannel : public Channel {
          public:
            ChannelKind kind() const noexcept override { return ChannelKind::Analog; }
            AnalogChannel *as_analog() noexcept override { return this; }

            virtual u16 sample() = 0;
        };

        class PwmChannel : public Channel {
          public:
            ChannelKind kind() const noexcept override { return ChannelKind::Pwm; }
            PwmChannel *as_pwm() noexcept override { return this; }

            virtual void set_duty_cycle(u32 duty) = 0;
        };

        // ─── Channel factory (provided by the board support code) ───────────────────
        // Returns null when the pin cannot provide the requested kind.
        class ChannelFactory {
          public:
            virtual ~ChannelFactory() = default;

            virtual std::unique_ptr<DigitalChannel> make_digital(PinIndex pin, PinDirection direction,
                                                                 PinPull pull) = 0;
            virtual std::unique_ptr<AnalogChannel> make_analog(PinIndex pin) = 0;
            virtual std::unique_ptr<PwmChannel> make_pwm(PinIndex pin) = 0;
        };

    } // namespace hw
    using namespace hw;
} // namespace devlink
