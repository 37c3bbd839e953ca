#pragma once

#include "../core/error.hpp"
#include "../core/types.hpp"
#include "radio_socket.hpp"
#include <chrono>
#include <echo/echo.hpp>
#include <memory>
#include <thread>
#include <wirebit/serial/serial_endpoint.hpp>

namespace devlink {

    // ─── Serial radio socket configuration ──────────────────────────────────────
    struct SerialSocketConfig {
        u32 baud = 115200;
        u32 endpoint_id = 1;
        u32 blocking_timeout_ms = 5000;
        u32 blocking_poll_ms = 10;

        SerialSocketConfig &baud_rate(u32 rate) {
            baud = rate;
            return *this;
        }
        SerialSocketConfig &endpoint(u32 id) {
            endpoint_id = id;
            return *this;
        }
        SerialSocketConfig &blocking_timeout(u32 ms) {
            blocking_timeout_ms = ms;
            return *this;
        }
    };

    // ─── RadioSocket over a serial-attached radio modem ─────────────────────────
    // The modem exchanges raw payloads over a wirebit link (UART, PTY or SHM).
    //
    // Usage:
    //   auto tty = wirebit::TtyLink::create({.device = "/dev/ttyUSB0", .baud = 115200});
    //   auto link = std::make_shared<wirebit::TtyLink>(std::move(tty.value()));
    //   auto socket = std::make_unique<SerialRadioSocket>(link);
    class SerialRadioSocket : public RadioSocket {
        std::shared_ptr<wirebit::Link> link_;
        wirebit::SerialEndpoint serial_;
        SerialSocketConfig config_;
        bool blocking_ = true;
        bool closed_ = false;

      public:
        explicit SerialRadioSocket(std::shared_ptr<wirebit::Link> link, const SerialSocketConfig &config = {})
            : link_(link), serial_(link_, wirebit::SerialConfig{.baud = config.baud}, config.endpoint_id),
              config_(config) {
            echo::category("devlink.serial").debug("serial radio socket opened at ", config.baud, " baud");
        }

        Result<void> set_blocking(bool blocking) override {
            if (closed_)
                return Result<void>::err(Error::not_connected());
            blocking_ = blocking;
            return {};
        }

        Result<void> send(const Bytes &data) override {
            if (closed_)
                return Result<void>::err(Error::not_connected());
            wirebit::Bytes payload(data.size());
            for (usize i = 0; i < data.size(); ++i)
                payload[i] = data[i];
            auto result = serial_.send(payload);
            if (!result.is_ok()) {
                return Result<void>::err(Error::transport_io("serial send failed: " + result.error().message));
            }
            echo::category("devlink.serial").trace("TX ", data.size(), " bytes");
            return {};
        }

        Result<Bytes> recv(usize max_size) override {
            if (closed_)
                return Result<Bytes>::err(Error::not_connected());

            u32 waited_ms = 0;
            while (true) {
                auto result = serial_.recv();
                if (result.is_ok()) {
                    const auto &data = result.value();
                    Bytes out;
                    for (usize i = 0; i < data.size() && i < max_size; ++i)
                        out.push_back(data[i]);
                    echo::category("devlink.serial").trace("RX ", out.size(), " bytes");
                    return Result<Bytes>::ok(std::move(out));
                }
                if (!blocking_)
                    return Result<Bytes>::ok(Bytes{});
                if (waited_ms >= config_.blocking_timeout_ms)
                    return Result<Bytes>::err(Error::transport_io("serial receive timed out"));
                std::this_thread::sleep_for(std::chrono::milliseconds(config_.blocking_poll_ms));
                waited_ms += config_.blocking_poll_ms;
            }
        }

        Result<void> close() override {
            closed_ = true;
            echo::category("devlink.serial").debug("serial radio socket closed");
            return {};
        }
    };

} // namespace devlink
