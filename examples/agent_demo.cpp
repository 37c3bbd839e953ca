#include "flat_codec.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <devlink.hpp>
#include <echo/echo.hpp>
#include <mutex>
#include <thread>

using namespace devlink;

static std::atomic<bool> running{true};
void signal_handler(int) { running = false; }

// ─── In-process broker standing in for the controller ───────────────────────
struct Broker {
    std::mutex mutex;
    dp::Vector<Bytes> downlink;

    void push(Bytes msg) {
        std::lock_guard<std::mutex> lock(mutex);
        downlink.push_back(std::move(msg));
    }
};

class LoopbackStream : public StreamClient {
    Broker &broker_;

  public:
    explicit LoopbackStream(Broker &broker) : broker_(broker) {}

    Result<void> connect(const StreamConfig &config, const StreamCredentials &creds) override {
        echo::info("[broker] ", creds.client_id, " connected to ", config.host);
        return {};
    }
    Result<void> subscribe(const dp::String &topic) override {
        echo::info("[broker] subscribed to ", topic);
        return {};
    }
    Result<void> publish(const dp::String &topic, const Bytes &payload) override {
        echo::info("[broker] ", topic, " <- ", payload.size(), " bytes (type ", static_cast<int>(payload[2]), ")");
        return {};
    }
    Result<dp::Optional<Bytes>> poll() override {
        std::lock_guard<std::mutex> lock(broker_.mutex);
        if (broker_.downlink.empty())
            return Result<dp::Optional<Bytes>>::ok(dp::nullopt);
        Bytes msg = std::move(broker_.downlink[0]);
        broker_.downlink.erase(broker_.downlink.begin());
        return Result<dp::Optional<Bytes>>::ok(dp::Optional<Bytes>(std::move(msg)));
    }
    Result<void> disconnect() override { return {}; }
};

class StreamOnly : public TransportProvider {
    Broker &broker_;

  public:
    explicit StreamOnly(Broker &broker) : broker_(broker) {}
    std::unique_ptr<StreamClient> stream_client() override { return std::make_unique<LoopbackStream>(broker_); }
    std::unique_ptr<WideRadio> wide_radio() override { return nullptr; }
    std::unique_ptr<NarrowRadio> narrow_radio() override { return nullptr; }
};

// ─── Simulated board ─────────────────────────────────────────────────────────
class Led : public DigitalChannel {
    PinIndex pin_;
    u8 level_ = 0;

  public:
    explicit Led(PinIndex pin) : pin_(pin) {}
    u8 level() override { return level_; }
    void set_level(u8 level) override {
        level_ = level;
        echo::info("[board] LED on pin ", static_cast<int>(pin_), level ? " ON" : " OFF");
    }
};

class Potentiometer : public AnalogChannel {
  public:
    u16 sample() override { return 512; }
};

class Dimmer : public PwmChannel {
  public:
    void set_duty_cycle(u32 duty) override { echo::info("[board] dimmer duty ", duty); }
};

class DemoBoard : public ChannelFactory {
  public:
    std::unique_ptr<DigitalChannel> make_digital(PinIndex pin, PinDirection, PinPull) override {
        return std::make_unique<Led>(pin);
    }
    std::unique_ptr<AnalogChannel> make_analog(PinIndex) override { return std::make_unique<Potentiometer>(); }
    std::unique_ptr<PwmChannel> make_pwm(PinIndex) override { return std::make_unique<Dimmer>(); }
};

int main() {
    echo::info("=== Device Agent Demo ===");

    Broker broker;
    StreamOnly platform(broker);
    DemoBoard board;
    FlatCodec codec;

    Agent agent(AgentConfig{}.device("240ac4c7").user("demo@example.com").console(true), codec, platform, board);

    agent.session().on_status_change().subscribe([](ConnectionStatus, ConnectionStatus to) {
        echo::info("Status: ", to_string(to));
    });

    agent.register_custom_method(3, [](const CustomParams &params) {
        u16 sum = 0;
        for (const auto &[slot, value] : params)
            sum = static_cast<u16>(sum + value);
        echo::info("custom method 3 called with ", params.size(), " params");
        return dp::Optional<CustomValues>(CustomValues{sum});
    });

    agent.set_user_callback([](const Bytes &raw) { echo::info("user message: ", raw.size(), " bytes"); });

    auto radio = agent.connect(WideRadioConfig::otaa("70B3D57ED0000001", "70B3D57ED0000000",
                                                     "00112233445566778899AABBCCDDEEFF"));
    if (!radio.is_ok()) {
        echo::warn("Wide-area radio: ", radio.error().message);
    }

    auto connected = agent.connect(StreamConfig{}.broker("mqtt.example.com"));
    if (!connected.is_ok()) {
        echo::error("Connect failed: ", connected.error().message);
        return 1;
    }
    agent.set_battery_level(87);

    signal(SIGINT, signal_handler);

    // Controller traffic
    broker.push(FlatCodec::system(MessageType::Ping));
    broker.push(FlatCodec::system(MessageType::BatteryInfo));
    broker.push(FlatCodec::system(MessageType::Command, {static_cast<u8>(PinCommand::DigitalWrite), 2, 0x00, 0x01}));
    broker.push(FlatCodec::system(MessageType::Command, {static_cast<u8>(PinCommand::AnalogRead), 5}));
    broker.push(FlatCodec::system(MessageType::Command, {static_cast<u8>(PinCommand::AnalogWrite), 6, 0x00, 0x32}));
    broker.push(FlatCodec::system(MessageType::Command,
                                  {static_cast<u8>(PinCommand::CustomMethod), 3, 0x00, 0x02, 0x00, 0x00, 0x05, 0x00}));
    broker.push(FlatCodec::system(MessageType::Command,
                                  {static_cast<u8>(PinCommand::CustomMethod), CONSOLE_PIN, 'p', 'i', 'n', 's'}));
    broker.push({0x00, 0x00, 0x10, 'h', 'i'});

    for (i32 i = 0; i < 20 && running; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    auto written = agent.console_write("demo finished");
    if (!written.is_ok()) {
        echo::warn("Console write failed: ", written.error().message);
    }
    agent.disconnect();
    return 0;
}
