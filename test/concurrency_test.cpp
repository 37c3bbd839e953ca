#include "test_support.hpp"

TEST_CASE("Radio-wide socket access is serialized between receiver and senders") {
    MockCodec codec;
    MockProvider provider;
    Session session(SessionConfig{}.device("dev42").radio_poll_interval(1), provider, codec);

    auto cfg = WideRadioConfig::otaa("70B3D57ED0000001", "70B3D57ED0000000", "00112233445566778899AABBCCDDEEFF");
    REQUIRE(session.connect_radio_wide(cfg).is_ok());

    constexpr int kMessages = 100;
    std::thread sender([&] {
        for (int i = 0; i < kMessages; ++i) {
            auto r = session.send({static_cast<u8>(i), static_cast<u8>(i ^ 0xFF)});
            CHECK(r.is_ok());
        }
    });
    sender.join();
    session.disconnect();

    auto socket = provider.wide->socket;
    CHECK_FALSE(socket->overlap);
    CHECK(socket->recv_calls > 0);
    REQUIRE(socket->sent_count() == kMessages);
    for (int i = 0; i < kMessages; ++i) {
        CHECK(socket->sent[i] == Bytes{static_cast<u8>(i), static_cast<u8>(i ^ 0xFF)});
        CHECK(socket->send_modes[i]);
    }
}

TEST_CASE("Stream publishes never interleave with polls") {
    MockCodec codec;
    MockProvider provider;
    Session session(SessionConfig{}.device("dev42"), provider, codec);
    REQUIRE(session.connect_stream(StreamConfig{}.broker("broker.local").poll_interval(1)).is_ok());

    dp::Vector<std::thread> senders;
    for (int t = 0; t < 4; ++t) {
        senders.emplace_back([&, t] {
            for (int i = 0; i < 25; ++i) {
                auto r = session.send({static_cast<u8>(t), static_cast<u8>(i)});
                CHECK(r.is_ok());
            }
        });
    }
    for (auto &s : senders)
        s.join();
    session.disconnect();

    CHECK_FALSE(provider.stream->overlap);
    CHECK(provider.stream->polls > 0);
    CHECK(provider.stream->published_count() == 100);
}

TEST_CASE("Disconnect from inside the inbound handler") {
    MockCodec codec;
    MockProvider provider;
    Session session(SessionConfig{}.device("dev42"), provider, codec);
    session.set_inbound_handler([&](const Bytes &) { session.disconnect(); });

    provider.stream->inject({0x01});
    REQUIRE(session.connect_stream(StreamConfig{}.broker("broker.local").poll_interval(1)).is_ok());
    REQUIRE(wait_until([&] { return !session.is_connected(); }));
    CHECK(provider.stream->disconnects == 1);

    // A fresh connection gets a fresh receiver
    provider.stream->inject({0x02});
    REQUIRE(session.connect_stream(StreamConfig{}.broker("broker.local").poll_interval(1)).is_ok());
    REQUIRE(wait_until([&] { return !session.is_connected(); }));
    CHECK(provider.stream->disconnects == 2);
}

TEST_CASE("Handler and foreground disconnecting at the same time both return") {
    MockCodec codec;
    MockProvider provider;
    std::atomic<bool> handler_entered{false};
    std::atomic<bool> handler_returned{false};
    Session session(SessionConfig{}.device("dev42"), provider, codec);
    session.set_inbound_handler([&](const Bytes &) {
        handler_entered = true;
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        session.disconnect();
        handler_returned = true;
    });

    provider.stream->inject({0x01});
    REQUIRE(session.connect_stream(StreamConfig{}.broker("broker.local").poll_interval(1)).is_ok());
    REQUIRE(wait_until([&] { return handler_entered.load(); }));

    // Runs while the handler sleeps, so it holds the lifecycle lock and joins
    std::atomic<bool> foreground_done{false};
    std::thread foreground([&] {
        session.disconnect();
        foreground_done = true;
    });

    CHECK(wait_until([&] { return foreground_done.load() && handler_returned.load(); }, 3000));
    foreground.join();
    CHECK_FALSE(session.is_connected());
    CHECK(provider.stream->disconnects == 1);
}

TEST_CASE("Scan info handle outlives a concurrent disconnect") {
    MockCodec codec;
    MockProvider provider;
    Session session(SessionConfig{}.device("dev42"), provider, codec);

    auto cfg = WideRadioConfig::otaa("70B3D57ED0000001", "70B3D57ED0000000", "00112233445566778899AABBCCDDEEFF");
    REQUIRE(session.connect_radio_wide(cfg).is_ok());

    auto radio = session.wide_radio();
    REQUIRE(radio != nullptr);
    session.disconnect();

    CHECK(session.wide_radio() == nullptr);
    CHECK(radio->has_joined());
}
