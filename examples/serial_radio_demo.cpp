#include "flat_codec.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <devlink.hpp>
#include <echo/echo.hpp>
#include <thread>
#include <wirebit/serial/serial_endpoint.hpp>
#include <wirebit/shm/shm_link.hpp>

using namespace devlink;

static std::atomic<bool> running{true};
void signal_handler(int) { running = false; }

// Wide-area radio modem attached over a wirebit link. Join handling is done
// by the modem firmware; this side only tracks the plan it was given.
class SerialModem : public WideRadio {
    std::shared_ptr<wirebit::Link> link_;
    bool joined_ = false;

  public:
    explicit SerialModem(std::shared_ptr<wirebit::Link> link) : link_(std::move(link)) {}

    Result<void> join(const JoinRequest &request, u32 timeout_ms) override {
        echo::info("[modem] join (", request.activation == Activation::Abp ? "ABP" : "OTAA", "), timeout ",
                   timeout_ms, " ms");
        joined_ = true;
        return {};
    }
    bool has_joined() const override { return joined_; }
    Result<void> remove_channel(u8 index) override {
        echo::debug("[modem] remove channel ", static_cast<int>(index));
        return {};
    }
    Result<void> add_channel(u8 index, u32 frequency_hz, u8 dr_min, u8 dr_max) override {
        echo::info("[modem] channel ", static_cast<int>(index), " at ", frequency_hz, " Hz, DR ",
                   static_cast<int>(dr_min), "-", static_cast<int>(dr_max));
        return {};
    }
    std::unique_ptr<RadioSocket> open_socket(u8 data_rate) override {
        echo::info("[modem] socket at DR ", static_cast<int>(data_rate));
        return std::make_unique<SerialRadioSocket>(link_);
    }
};

class ModemPlatform : public TransportProvider {
    std::shared_ptr<wirebit::Link> link_;

  public:
    explicit ModemPlatform(std::shared_ptr<wirebit::Link> link) : link_(std::move(link)) {}
    std::unique_ptr<StreamClient> stream_client() override { return nullptr; }
    std::unique_ptr<WideRadio> wide_radio() override { return std::make_unique<SerialModem>(link_); }
    std::unique_ptr<NarrowRadio> narrow_radio() override { return nullptr; }
};

class Relay : public DigitalChannel {
    u8 level_ = 0;

  public:
    u8 level() override { return level_; }
    void set_level(u8 level) override {
        level_ = level;
        echo::info("[board] relay ", level ? "closed" : "open");
    }
};

class RelayBoard : public ChannelFactory {
  public:
    std::unique_ptr<DigitalChannel> make_digital(PinIndex, PinDirection, PinPull) override {
        return std::make_unique<Relay>();
    }
    std::unique_ptr<AnalogChannel> make_analog(PinIndex) override { return nullptr; }
    std::unique_ptr<PwmChannel> make_pwm(PinIndex) override { return nullptr; }
};

// Demonstrates the agent on a serial-attached wide-area radio. A ShmLink
// stands in for the UART; the gateway side injects downlink frames.
int main() {
    echo::info("=== Serial Radio Agent Demo ===");

    auto link_result = wirebit::ShmLink::create("devlink_modem", 4096);
    if (!link_result.is_ok()) {
        echo::error("Failed to create ShmLink for modem simulation");
        return 1;
    }
    auto link = std::make_shared<wirebit::ShmLink>(std::move(link_result.value()));

    auto gw_result = wirebit::ShmLink::attach("devlink_modem");
    if (!gw_result.is_ok()) {
        echo::error("Failed to attach gateway ShmLink");
        return 1;
    }
    auto gw_link = std::make_shared<wirebit::ShmLink>(std::move(gw_result.value()));
    wirebit::SerialEndpoint gateway(gw_link, wirebit::SerialConfig{.baud = 115200}, 2);

    ModemPlatform platform(link);
    RelayBoard board;
    FlatCodec codec;
    Agent agent(AgentConfig{}.device("70b3d57e").radio_poll_interval(100), codec, platform, board);

    auto cfg = WideRadioConfig::abp("26011BDA", "000102030405060708090A0B0C0D0E0F", "F0E0D0C0B0A090807060504030201000")
                   .use_concentrator(true);
    auto connected = agent.connect(cfg);
    if (!connected.is_ok()) {
        echo::error("Join failed: ", connected.error().message);
        return 1;
    }

    signal(SIGINT, signal_handler);

    // Gateway closes relay 1
    Bytes downlink = FlatCodec::system(MessageType::Command, {static_cast<u8>(PinCommand::DigitalWrite), 1, 0x00, 0x01});
    wirebit::Bytes frame(downlink.size());
    for (usize i = 0; i < downlink.size(); ++i)
        frame[i] = downlink[i];
    auto pushed = gateway.send(frame);
    if (!pushed.is_ok()) {
        echo::warn("Gateway send failed");
    }

    for (i32 i = 0; i < 10 && running; ++i) {
        auto sent = agent.send_ping();
        if (!sent.is_ok()) {
            echo::warn("Ping failed: ", sent.error().message);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    agent.disconnect();
    return 0;
}
