#pragma once

#include <devlink.hpp>
#include <mutex>

// Minimal codec for the demos: [flags][network][type][body...]
// flags bit 0 = system originator, bit 1 = persistent
class FlatCodec : public devlink::Codec {
    std::mutex mutex_;
    devlink::u8 network_ = 0;

  public:
    void set_network_type(devlink::NetworkType type) override {
        std::lock_guard<std::mutex> lock(mutex_);
        network_ = static_cast<devlink::u8>(type);
    }

    devlink::Bytes encode_ping() override { return frame(true, false, devlink::MessageType::Ping, {}); }
    devlink::Bytes encode_info() override { return frame(true, false, devlink::MessageType::Info, {'d', 'e', 'm', 'o'}); }
    devlink::Bytes encode_network_info() override {
        return frame(true, false, devlink::MessageType::NetworkInfo, {network()});
    }
    devlink::Bytes encode_scan_info(const devlink::WideRadio *radio) override {
        return frame(true, false, devlink::MessageType::ScanInfo, {static_cast<devlink::u8>(radio ? 1 : 0)});
    }
    devlink::Bytes encode_battery_info(devlink::i32 level) override {
        return frame(true, false, devlink::MessageType::BatteryInfo, {static_cast<devlink::u8>(level)});
    }
    devlink::Bytes encode_ota_result(devlink::i32 code) override {
        return frame(true, false, devlink::MessageType::Ota, {static_cast<devlink::u8>(code)});
    }
    devlink::Bytes encode_pin_value(bool persistent, devlink::PinCommand command, devlink::u8 pin,
                                    devlink::u16 value) override {
        return frame(true, persistent, devlink::MessageType::Command,
                     {static_cast<devlink::u8>(command), pin, static_cast<devlink::u8>(value >> 8),
                      static_cast<devlink::u8>(value & 0xFF)});
    }
    devlink::Bytes encode_pin_values_variable(bool persistent, devlink::PinCommand command, devlink::u8 pin,
                                              const devlink::Bytes &values) override {
        devlink::Bytes body = {static_cast<devlink::u8>(command), pin};
        body.insert(body.end(), values.begin(), values.end());
        return frame(true, persistent, devlink::MessageType::Command, body);
    }
    devlink::Bytes encode_user_message(bool persistent, devlink::u8 type, const devlink::Bytes &body) override {
        devlink::Bytes out = {static_cast<devlink::u8>(persistent ? 0x02 : 0x00), network(), type};
        out.insert(out.end(), body.begin(), body.end());
        return out;
    }

    devlink::Result<devlink::Envelope> decode(const devlink::Bytes &raw) override {
        if (raw.size() < 3)
            return devlink::Result<devlink::Envelope>::err(devlink::Error::decode_failed("frame too short"));
        devlink::Envelope env;
        env.originator = (raw[0] & 0x01) ? devlink::Originator::System : devlink::Originator::User;
        env.persistent = (raw[0] & 0x02) != 0;
        env.network_type = raw[1];
        env.type = raw[2];
        env.body.assign(raw.begin() + 3, raw.end());
        return devlink::Result<devlink::Envelope>::ok(std::move(env));
    }

    // Controller-side helper
    static devlink::Bytes system(devlink::MessageType type, devlink::Bytes body = {}) {
        devlink::Bytes out = {0x01, 0x00, static_cast<devlink::u8>(type)};
        out.insert(out.end(), body.begin(), body.end());
        return out;
    }

  private:
    devlink::u8 network() {
        std::lock_guard<std::mutex> lock(mutex_);
        return network_;
    }

    devlink::Bytes frame(bool system, bool persistent, devlink::MessageType type, const devlink::Bytes &body) {
        devlink::u8 flags = static_cast<devlink::u8>((system ? 0x01 : 0x00) | (persistent ? 0x02 : 0x00));
        devlink::Bytes out = {flags, network(), static_cast<devlink::u8>(type)};
        out.insert(out.end(), body.begin(), body.end());
        return out;
    }
};
