#include "test_support.hpp"

namespace {

    SessionConfig test_config() { return SessionConfig{}.device("dev42").user("owner").radio_poll_interval(5); }

    StreamConfig fast_stream() { return StreamConfig{}.broker("broker.local").poll_interval(5); }

    WideRadioConfig test_abp() {
        return WideRadioConfig::abp("26011BDA", "000102030405060708090A0B0C0D0E0F", "F0E0D0C0B0A090807060504030201000");
    }

} // namespace

TEST_CASE("Session topics derive from the device id") {
    MockCodec codec;
    MockProvider provider;
    Session session(test_config(), provider, codec);

    CHECK(session.uplink_topic() == "udev42");
    CHECK(session.downlink_topic() == "ddev42");
    CHECK(session.status() == ConnectionStatus::Disconnected);
    CHECK_FALSE(session.is_connected());
}

TEST_CASE("Session stream connect") {
    MockCodec codec;
    MockProvider provider;
    Session session(test_config(), provider, codec);

    SUBCASE("subscribes to the downlink topic and uses device credentials") {
        REQUIRE(session.connect_stream(fast_stream()).is_ok());
        CHECK(session.status() == ConnectionStatus::ConnectedStream);
        REQUIRE(provider.stream->subscribed.size() == 1);
        CHECK(provider.stream->subscribed[0] == "ddev42");
        CHECK(provider.stream->credentials.client_id == "dev42");
        CHECK(provider.stream->credentials.user == "owner");
        CHECK(provider.stream->credentials.password == "dev42");
        CHECK(codec.network_type == static_cast<int>(NetworkType::Wifi));
    }

    SUBCASE("auth failure leaves the session disconnected") {
        provider.stream->connect_result = Result<void>::err(Error::auth_failure("bad password"));
        auto r = session.connect_stream(fast_stream());
        REQUIRE_FALSE(r.is_ok());
        CHECK(r.error().code == ErrorCode::AuthFailure);
        CHECK(session.status() == ConnectionStatus::Disconnected);
    }

    SUBCASE("unsupported on this device") {
        provider.has_stream = false;
        auto r = session.connect(fast_stream());
        REQUIRE_FALSE(r.is_ok());
        CHECK(r.error().code == ErrorCode::UnsupportedTransport);
        CHECK(session.status() == ConnectionStatus::Disconnected);
    }
}

TEST_CASE("Session rejects a second connect of any kind") {
    MockCodec codec;
    MockProvider provider;
    Session session(test_config(), provider, codec);
    REQUIRE(session.connect_radio_narrow(NarrowRadioConfig{}).is_ok());

    auto stream = session.connect_stream(fast_stream());
    auto wide = session.connect_radio_wide(test_abp());
    auto narrow = session.connect_radio_narrow(NarrowRadioConfig{});

    REQUIRE_FALSE(stream.is_ok());
    REQUIRE_FALSE(wide.is_ok());
    REQUIRE_FALSE(narrow.is_ok());
    CHECK(stream.error().code == ErrorCode::AlreadyConnected);
    CHECK(wide.error().code == ErrorCode::AlreadyConnected);
    CHECK(narrow.error().code == ErrorCode::AlreadyConnected);
    CHECK(session.status() == ConnectionStatus::ConnectedRadioNarrow);
}

TEST_CASE("Session radio-wide join") {
    MockCodec codec;
    MockProvider provider;
    Session session(test_config(), provider, codec);

    SUBCASE("ABP keys are decoded") {
        REQUIRE(session.connect_radio_wide(test_abp()).is_ok());
        const auto &req = provider.wide->last_request;
        CHECK(req.activation == Activation::Abp);
        CHECK(req.dev_addr == 0x26011BDAu);
        REQUIRE(req.nwk_skey.size() == 16);
        CHECK(req.nwk_skey[0] == 0x00);
        CHECK(req.nwk_skey[15] == 0x0F);
        REQUIRE(req.app_skey.size() == 16);
        CHECK(req.app_skey[0] == 0xF0);
        CHECK(provider.wide->socket_dr == RADIO_SOCKET_DR);
        CHECK(codec.network_type == static_cast<int>(NetworkType::LoRa));
        CHECK(session.wide_radio() != nullptr);
    }

    SUBCASE("OTAA keys and join timeout are passed through") {
        auto config = WideRadioConfig::otaa("70B3D57ED0000001", "70B3D57ED0000000", "00112233445566778899AABBCCDDEEFF")
                          .join_timeout(2500);
        REQUIRE(session.connect_radio_wide(config).is_ok());
        const auto &req = provider.wide->last_request;
        CHECK(req.activation == Activation::Otaa);
        CHECK(req.dev_eui.size() == 8);
        CHECK(req.app_eui.size() == 8);
        CHECK(req.app_key.size() == 16);
        CHECK(provider.wide->last_timeout_ms == 2500);
    }

    SUBCASE("join timeout is surfaced") {
        provider.wide->join_result = Result<void>::err(Error::join_timeout(100));
        auto r = session.connect_radio_wide(test_abp().join_timeout(100));
        REQUIRE_FALSE(r.is_ok());
        CHECK(r.error().code == ErrorCode::JoinTimeout);
        CHECK(session.status() == ConnectionStatus::Disconnected);
        CHECK(session.wide_radio() == nullptr);
    }

    SUBCASE("malformed key is invalid data") {
        auto r = session.connect_radio_wide(WideRadioConfig::abp("XYZ", "00", "00"));
        REQUIRE_FALSE(r.is_ok());
        CHECK(r.error().code == ErrorCode::InvalidData);
        CHECK(session.status() == ConnectionStatus::Disconnected);
    }

    SUBCASE("socket failure is transport io") {
        provider.wide->fail_socket = true;
        auto r = session.connect_radio_wide(test_abp());
        REQUIRE_FALSE(r.is_ok());
        CHECK(r.error().code == ErrorCode::TransportIo);
        CHECK(session.status() == ConnectionStatus::Disconnected);
    }

    SUBCASE("concentrator plan keeps three channels on one frequency") {
        REQUIRE(session.connect_radio_wide(test_abp().use_concentrator(true)).is_ok());
        REQUIRE(provider.wide->removed.size() == 13);
        CHECK(provider.wide->removed.front() == 3);
        CHECK(provider.wide->removed.back() == 15);
        REQUIRE(provider.wide->added.size() == 3);
        for (usize i = 0; i < provider.wide->added.size(); ++i) {
            const auto &ch = provider.wide->added[i];
            CHECK(ch.index == i);
            CHECK(ch.frequency_hz == 868100000u);
            CHECK(ch.dr_min == 0);
            CHECK(ch.dr_max == 5);
        }
    }

    SUBCASE("no plan without a concentrator") {
        REQUIRE(session.connect_radio_wide(test_abp()).is_ok());
        CHECK(provider.wide->removed.empty());
        CHECK(provider.wide->added.empty());
    }
}

TEST_CASE("Session radio-narrow") {
    MockCodec codec;
    MockProvider provider;
    Session session(test_config(), provider, codec);
    REQUIRE(session.connect_radio_narrow(NarrowRadioConfig{}).is_ok());

    CHECK(provider.narrow->zone == RadioZone::Rcz1);
    CHECK_FALSE(provider.narrow->rx_enabled);
    CHECK(codec.network_type == static_cast<int>(NetworkType::Sigfox));

    SUBCASE("twelve bytes go out") {
        Bytes payload(12, 0x55);
        REQUIRE(session.send(payload).is_ok());
        REQUIRE(provider.narrow->socket->sent_count() == 1);
        CHECK(provider.narrow->socket->sent[0] == payload);
        CHECK(provider.narrow->socket->send_modes[0]); // blocking
    }

    SUBCASE("thirteen bytes are rejected before the radio") {
        auto r = session.send(Bytes(13, 0x55));
        REQUIRE_FALSE(r.is_ok());
        CHECK(r.error().code == ErrorCode::PayloadTooLarge);
        CHECK(provider.narrow->socket->sent_count() == 0);
    }

    SUBCASE("no receiver runs") {
        provider.narrow->socket->inject({0x01});
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        CHECK(provider.narrow->socket->recv_calls == 0);
    }
}

TEST_CASE("Session send routing") {
    MockCodec codec;
    MockProvider provider;
    Session session(test_config(), provider, codec);

    SUBCASE("not connected") {
        auto r = session.send({0x01});
        REQUIRE_FALSE(r.is_ok());
        CHECK(r.error().code == ErrorCode::NotConnected);
    }

    SUBCASE("stream publishes on the uplink topic") {
        REQUIRE(session.connect_stream(fast_stream()).is_ok());
        REQUIRE(session.send({0x01, 0x02}).is_ok());
        REQUIRE(session.send({0x03}, dp::String("ota")).is_ok());
        REQUIRE(provider.stream->published_count() == 2);
        CHECK(provider.stream->published_at(0).first == "udev42");
        CHECK(provider.stream->published_at(0).second == Bytes{0x01, 0x02});
        CHECK(provider.stream->published_at(1).first == "udev42/ota");
    }

    SUBCASE("radio-wide sends in blocking mode") {
        REQUIRE(session.connect_radio_wide(test_abp()).is_ok());
        REQUIRE(session.send({0xAB}).is_ok());
        REQUIRE(provider.wide->socket->sent_count() == 1);
        CHECK(provider.wide->socket->send_modes[0]);
    }
}

TEST_CASE("Session disconnect") {
    MockCodec codec;
    MockProvider provider;
    Session session(test_config(), provider, codec);

    SUBCASE("idempotent when never connected") {
        session.disconnect();
        session.disconnect();
        CHECK(session.status() == ConnectionStatus::Disconnected);
    }

    SUBCASE("stream client is closed once") {
        REQUIRE(session.connect_stream(fast_stream()).is_ok());
        session.disconnect();
        session.disconnect();
        CHECK(provider.stream->disconnects == 1);
        CHECK(session.status() == ConnectionStatus::Disconnected);
    }

    SUBCASE("close errors still end the connection") {
        provider.wide->socket->close_result = Result<void>::err(Error::transport_io("modem gone"));
        REQUIRE(session.connect_radio_wide(test_abp()).is_ok());
        session.disconnect();
        CHECK(session.status() == ConnectionStatus::Disconnected);
        CHECK(provider.wide->socket->closed);
        CHECK(session.wide_radio() == nullptr);
    }

    SUBCASE("reconnect after disconnect") {
        REQUIRE(session.connect_radio_narrow(NarrowRadioConfig{}).is_ok());
        session.disconnect();
        REQUIRE(session.connect_stream(fast_stream()).is_ok());
        CHECK(session.status() == ConnectionStatus::ConnectedStream);
    }
}

TEST_CASE("Session status change events") {
    MockCodec codec;
    MockProvider provider;
    Session session(test_config(), provider, codec);

    dp::Vector<ConnectionStatus> seen;
    session.on_status_change().subscribe([&](ConnectionStatus, ConnectionStatus to) { seen.push_back(to); });

    REQUIRE(session.connect_radio_narrow(NarrowRadioConfig{}).is_ok());
    session.disconnect();
    session.disconnect();

    REQUIRE(seen.size() == 2);
    CHECK(seen[0] == ConnectionStatus::ConnectedRadioNarrow);
    CHECK(seen[1] == ConnectionStatus::Disconnected);
}

TEST_CASE("Session stream receiver") {
    std::mutex mutex;
    dp::Vector<Bytes> delivered;
    MockCodec codec;
    MockProvider provider;
    Session session(test_config(), provider, codec);

    session.set_inbound_handler([&](const Bytes &raw) {
        std::lock_guard<std::mutex> lock(mutex);
        delivered.push_back(raw);
    });
    auto count = [&] {
        std::lock_guard<std::mutex> lock(mutex);
        return delivered.size();
    };

    SUBCASE("delivers every pending message in order") {
        provider.stream->inject({0x01});
        provider.stream->inject({0x02});
        provider.stream->inject({0x03});
        REQUIRE(session.connect_stream(fast_stream()).is_ok());
        REQUIRE(wait_until([&] { return count() == 3; }));
        std::lock_guard<std::mutex> lock(mutex);
        CHECK(delivered[0] == Bytes{0x01});
        CHECK(delivered[2] == Bytes{0x03});
    }

    SUBCASE("poll errors do not stop the loop") {
        {
            std::lock_guard<std::mutex> lock(provider.stream->mutex);
            provider.stream->fail_polls = true;
        }
        REQUIRE(session.connect_stream(fast_stream()).is_ok());
        REQUIRE(wait_until([&] { return provider.stream->polls >= 3; }));
        {
            std::lock_guard<std::mutex> lock(provider.stream->mutex);
            provider.stream->fail_polls = false;
        }
        provider.stream->inject({0x7F});
        REQUIRE(wait_until([&] { return count() == 1; }));
    }

    SUBCASE("handler exceptions are contained") {
        session.set_inbound_handler([&](const Bytes &raw) {
            {
                std::lock_guard<std::mutex> lock(mutex);
                delivered.push_back(raw);
            }
            throw std::runtime_error("handler bug");
        });
        provider.stream->inject({0x01});
        provider.stream->inject({0x02});
        REQUIRE(session.connect_stream(fast_stream()).is_ok());
        REQUIRE(wait_until([&] { return count() == 2; }));
        CHECK(session.is_connected());
    }

    SUBCASE("handler may send replies") {
        session.set_inbound_handler([&](const Bytes &raw) {
            auto r = session.send(raw);
            std::lock_guard<std::mutex> lock(mutex);
            if (r.is_ok())
                delivered.push_back(raw);
        });
        provider.stream->inject({0x42});
        REQUIRE(session.connect_stream(fast_stream()).is_ok());
        REQUIRE(wait_until([&] { return count() == 1; }));
        CHECK(provider.stream->published_at(0).second == Bytes{0x42});
    }

    SUBCASE("stops polling after disconnect") {
        REQUIRE(session.connect_stream(fast_stream()).is_ok());
        REQUIRE(wait_until([&] { return provider.stream->polls >= 1; }));
        session.disconnect();
        int polls = provider.stream->polls;
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        CHECK(provider.stream->polls == polls);
    }
}

TEST_CASE("Session radio-wide receiver") {
    std::atomic<int> delivered{0};
    MockCodec codec;
    MockProvider provider;
    Session session(test_config(), provider, codec);

    session.set_inbound_handler([&](const Bytes &) { ++delivered; });

    REQUIRE(session.connect_radio_wide(test_abp()).is_ok());
    provider.wide->socket->inject({0x10, 0x20});
    REQUIRE(wait_until([&] { return delivered == 1; }));

    SUBCASE("empty reads are not delivered") {
        int polls = provider.wide->socket->recv_calls;
        REQUIRE(wait_until([&] { return provider.wide->socket->recv_calls > polls + 2; }));
        CHECK(delivered == 1);
    }

    SUBCASE("exits on disconnect") {
        session.disconnect();
        int polls = provider.wide->socket->recv_calls;
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        CHECK(provider.wide->socket->recv_calls == polls);
    }
}
