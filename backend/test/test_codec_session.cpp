// Codec against an in-process websocket peer over plain TCP.
#include "gateway/codec.hpp"
#include "gateway/connection.hpp"
#include "loopback_gateway.hpp"
#include "test_util.hpp"

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using json = nlohmann::json;
using loopback::Gateway;
using loopback::PlainWs;

struct RecordingSink : IDiagnosticSink
{
    std::vector<DecodeError> seen;
    void decode_failed(const DecodeError &err) override { seen.push_back(err); }
};

static GatewayConfig plain_config()
{
    GatewayConfig cfg;
    cfg.backend = TransportBackend::plain;
    return cfg;
}

static void test_send_is_exact_text_frame()
{
    std::string body;
    bool was_text = false;
    Gateway peer([&](PlainWs &ws) {
        body = loopback::read_message(ws);
        was_text = ws.got_text();
        loopback::send_text(ws, body);
    });

    GatewayCodec codec{gateway_connect(peer.url(), plain_config()), plain_config()};
    codec.send_encoded(json{{"op", 1}});

    auto ev = codec.receive_decoded(true);
    EXPECT(ev && ev->outcome.ok());
    EXPECT(*ev->outcome.value == json({{"op", 1}}));

    peer.join();
    EXPECT(peer.error().empty());
    EXPECT(body == "{\"op\":1}");
    EXPECT(was_text);
}

static void test_binary_ready()
{
    Gateway peer([](PlainWs &ws) {
        loopback::send_binary(ws, loopback::zlib_compress(R"({"t":"READY"})"));
        loopback::read_message(ws);
    });

    GatewayCodec codec{gateway_connect(peer.url(), plain_config()), plain_config()};
    auto ev = codec.receive_decoded(true);
    EXPECT(ev && ev->outcome.ok());
    EXPECT(*ev->outcome.value == json({{"t", "READY"}}));
    EXPECT(!ev->event.receipt);
    codec.send_encoded(json{{"done", true}});
}

static void test_malformed_does_not_kill_connection()
{
    const std::string garbage = loopback::zlib_compress("<html>nope</html>");
    Gateway peer([&](PlainWs &ws) {
        loopback::send_binary(ws, garbage);
        loopback::send_text(ws, "{\"op\":");
        loopback::send_text(ws, R"({"op":11})");
        loopback::read_message(ws);
    });

    auto sink = std::make_shared<RecordingSink>();
    GatewayCodec codec{gateway_connect(peer.url(), plain_config()), plain_config(), sink};

    auto bad_bin = codec.receive_decoded(true);
    EXPECT(bad_bin && !bad_bin->outcome.ok());
    EXPECT(bad_bin->outcome.error->kind() == GatewayErrorKind::malformed);
    EXPECT(bad_bin->outcome.error->raw() == garbage);

    auto bad_text = codec.receive_decoded(true);
    EXPECT(bad_text && !bad_text->outcome.ok());
    EXPECT(bad_text->outcome.error->raw() == "{\"op\":");

    auto good = codec.receive_decoded(true);
    EXPECT(good && good->outcome.ok());
    EXPECT((*good->outcome.value)["op"] == 11);
    EXPECT(codec.connection().is_open());

    EXPECT(sink->seen.size() == 2);
    if (sink->seen.size() == 2)
    {
        EXPECT(sink->seen[0].raw() == garbage);
        EXPECT(sink->seen[0].binary());
        EXPECT(!sink->seen[1].binary());
    }
    codec.send_encoded(json{{"done", true}});
}

static void test_ping_answered_with_same_payload()
{
    std::vector<std::string> pongs;
    std::string after;
    Gateway peer([&](PlainWs &ws) {
        ws.control_callback([&](boost::beast::websocket::frame_type kind, boost::beast::string_view p) {
            if (kind == boost::beast::websocket::frame_type::pong)
                pongs.emplace_back(p.data(), p.size());
        });
        ws.ping(boost::beast::websocket::ping_data("hb-42"));
        loopback::send_text(ws, R"({"t":"AFTER_PING"})");
        after = loopback::read_message(ws);
    });

    GatewayCodec codec{gateway_connect(peer.url(), plain_config()), plain_config()};
    auto ev = codec.receive_decoded(true);
    EXPECT(ev && ev->outcome.ok());
    EXPECT((*ev->outcome.value)["t"] == "AFTER_PING");

    const auto &stats = codec.connection().control_stats();
    EXPECT(stats.pings == 1);
    EXPECT(stats.last_ping == "hb-42");

    codec.send_encoded(json{{"ack", true}});
    peer.join();
    EXPECT(peer.error().empty());
    EXPECT(pongs.size() == 1);
    EXPECT(!pongs.empty() && pongs.front() == "hb-42");
    EXPECT(after == "{\"ack\":true}");
}

static void test_ping_answered_while_polling()
{
    std::vector<std::string> pongs;
    Gateway peer([&](PlainWs &ws) {
        ws.control_callback([&](boost::beast::websocket::frame_type kind, boost::beast::string_view p) {
            if (kind == boost::beast::websocket::frame_type::pong)
                pongs.emplace_back(p.data(), p.size());
        });
        ws.ping(boost::beast::websocket::ping_data("poll-hb"));
        loopback::read_message(ws); // pong is consumed ahead of the client's next message
    });

    GatewayCodec codec{gateway_connect(peer.url(), plain_config()), plain_config()};

    // The ping alone never yields an event; keep polling until it has been seen.
    for (int i = 0; i < 300 && codec.connection().control_stats().pings == 0; ++i)
    {
        EXPECT(!codec.receive_decoded(false));
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT(codec.connection().control_stats().pings == 1);
    EXPECT(codec.connection().control_stats().last_ping == "poll-hb");

    codec.send_encoded(json{{"done", true}});
    peer.join();
    EXPECT(peer.error().empty());
    EXPECT(pongs.size() == 1);
    EXPECT(!pongs.empty() && pongs.front() == "poll-hb");
}

static void test_moved_from_connection()
{
    Gateway peer([](PlainWs &ws) { loopback::read_message(ws); });

    GatewayConnection conn = gateway_connect(peer.url(), plain_config());
    GatewayCodec codec{std::move(conn), plain_config()};
    conn.cancel(); // moved-from: nothing to cancel
    EXPECT(!conn.is_open());
    EXPECT(conn.control_stats().pings == 0);
    EXPECT(codec.connection().is_open());
    codec.send_encoded(json{{"done", true}});
}

static void test_polling_returns_when_idle()
{
    Gateway peer([](PlainWs &ws) {
        loopback::read_message(ws); // wait for the client to go first
        loopback::send_text(ws, R"({"t":"LATE"})");
        loopback::read_message(ws);
    });

    GatewayCodec codec{gateway_connect(peer.url(), plain_config()), plain_config()};

    auto t0 = std::chrono::steady_clock::now();
    auto none = codec.receive_decoded(false);
    auto elapsed = std::chrono::steady_clock::now() - t0;
    EXPECT(!none);
    EXPECT(elapsed < std::chrono::milliseconds(500));
    EXPECT(codec.connection().is_open());

    codec.send_encoded(json{{"go", 1}});

    std::optional<ReceivedEvent> ev;
    for (int i = 0; i < 300 && !ev; ++i)
    {
        ev = codec.receive_decoded(false);
        if (!ev)
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT(ev && ev->outcome.ok());
    EXPECT(ev && (*ev->outcome.value)["t"] == "LATE");
    codec.send_encoded(json{{"done", true}});
}

static void test_close_is_terminal()
{
    Gateway peer([](PlainWs &ws) {
        ws.close(boost::beast::websocket::close_reason(static_cast<boost::beast::websocket::close_code>(4000), "bye"));
    });

    GatewayCodec codec{gateway_connect(peer.url(), plain_config()), plain_config()};
    try
    {
        codec.receive_decoded(true);
        EXPECT(false);
    }
    catch (const ConnectionClosedError &e)
    {
        EXPECT(e.kind() == GatewayErrorKind::connection_closed);
        EXPECT(e.close_code() && *e.close_code() == 4000);
        EXPECT(e.reason() == "bye");
    }
    EXPECT(!codec.connection().is_open());

    expect_kind("receive after close", GatewayErrorKind::connection_closed,
                [&] { codec.receive_decoded(false); });
    expect_kind("send after close", GatewayErrorKind::connection_closed,
                [&] { codec.send_encoded(json{{"op", 1}}); });
    expect_kind("close after close", GatewayErrorKind::connection_closed, [&] { codec.close(); });
}

static void test_close_as_no_message()
{
    Gateway peer([](PlainWs &ws) {
        ws.close(boost::beast::websocket::close_reason(boost::beast::websocket::close_code::going_away, "going away"));
    });

    GatewayConfig cfg = plain_config();
    cfg.close_policy = ClosePolicy::no_message;
    GatewayCodec codec{gateway_connect(peer.url(), cfg), cfg};

    EXPECT(!codec.receive_decoded(true));
    EXPECT(!codec.connection().is_open());
    expect_kind("receive after no_message close", GatewayErrorKind::connection_closed,
                [&] { codec.receive_decoded(true); });
}

static void test_receipts_when_enabled()
{
    Gateway peer([](PlainWs &ws) {
        loopback::send_text(ws, R"({"op":10,"d":{"heartbeat_interval":41250}})");
        loopback::read_message(ws);
    });

    GatewayConfig cfg = plain_config();
    cfg.capture_receipts = true;
    GatewayCodec codec{gateway_connect(peer.url(), cfg), cfg};

    auto before = std::chrono::system_clock::now();
    auto ev = codec.receive_decoded(true);
    EXPECT(ev && ev->outcome.ok());
    EXPECT(ev && ev->event.receipt.has_value());
    if (ev && ev->event.receipt)
    {
        const auto &r = *ev->event.receipt;
        EXPECT(r.received_at >= before - std::chrono::seconds(1));
        const auto *text = std::get_if<TextFrame>(&r.frame);
        EXPECT(text && text->payload == R"({"op":10,"d":{"heartbeat_interval":41250}})");
    }
    codec.send_encoded(json{{"done", true}});
}

static void test_peer_drop_is_io()
{
    Gateway peer([](PlainWs &) {}); // accepts, upgrades, hangs up without a close frame

    GatewayCodec codec{gateway_connect(peer.url(), plain_config()), plain_config()};
    peer.join();
    expect_kind("receive after drop", GatewayErrorKind::io, [&] { codec.receive_decoded(true); });
    expect_kind("receive on failed connection", GatewayErrorKind::io, [&] { codec.receive_decoded(false); });
}

static void test_cancel_unblocks_receive()
{
    Gateway peer([](PlainWs &ws) { loopback::read_message(ws); });

    GatewayCodec codec{gateway_connect(peer.url(), plain_config()), plain_config()};
    std::thread canceller([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        codec.cancel();
    });
    expect_kind("cancelled receive", GatewayErrorKind::io, [&] { codec.receive_decoded(true); });
    canceller.join();
    EXPECT(!codec.connection().is_open());
}

static void test_encode_error()
{
    std::string body;
    Gateway peer([&](PlainWs &ws) { body = loopback::read_message(ws); });

    GatewayCodec codec{gateway_connect(peer.url(), plain_config()), plain_config()};
    expect_kind("invalid utf-8", GatewayErrorKind::encode,
                [&] { codec.send_encoded(json{{"content", std::string("\xff\xfe")}}); });
    EXPECT(codec.connection().is_open());
    codec.send_encoded(json{{"op", 2}});
    peer.join();
    EXPECT(body == "{\"op\":2}");
}

static void test_local_close()
{
    Gateway peer([](PlainWs &ws) {
        boost::beast::flat_buffer buf;
        boost::beast::error_code ec;
        ws.read(buf, ec); // returns websocket::error::closed once the client closes
    });

    GatewayCodec codec{gateway_connect(peer.url(), plain_config()), plain_config()};
    codec.close();
    EXPECT(!codec.connection().is_open());
    expect_kind("send after local close", GatewayErrorKind::connection_closed,
                [&] { codec.send_encoded(json{{"op", 1}}); });
}

int main()
{
    run_case("send_is_exact_text_frame", test_send_is_exact_text_frame);
    run_case("binary_ready", test_binary_ready);
    run_case("malformed_does_not_kill_connection", test_malformed_does_not_kill_connection);
    run_case("ping_answered_with_same_payload", test_ping_answered_with_same_payload);
    run_case("ping_answered_while_polling", test_ping_answered_while_polling);
    run_case("polling_returns_when_idle", test_polling_returns_when_idle);
    run_case("moved_from_connection", test_moved_from_connection);
    run_case("close_is_terminal", test_close_is_terminal);
    run_case("close_as_no_message", test_close_as_no_message);
    run_case("receipts_when_enabled", test_receipts_when_enabled);
    run_case("peer_drop_is_io", test_peer_drop_is_io);
    run_case("cancel_unblocks_receive", test_cancel_unblocks_receive);
    run_case("encode_error", test_encode_error);
    run_case("local_close", test_local_close);
    return finish("test_codec_session");
}
