#include <catch2/catch.hpp>
#include "relay/relay_manager.h"
#include "store/message_queue.h"
#include "helpers/fake_session.h"
#include <functional>
#include <memory>
#include <string>

using json = nlohmann::json;

namespace {

const std::string kA = "0xaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa";
const std::string kB = "0xbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbb";
const std::string kC = "0xcccccccccccccccccccccccccccccccccccccccc";

struct Client {
    std::shared_ptr<FakeSession> session;
    ConnectionContext ctx;
};

struct RelayHarness {
    FakeClock clock;
    MessageQueue queue{100, 168, std::ref(clock)};
    RelayManager relay{queue, std::ref(clock)};

    Client connect(const std::string& name = "peer") {
        Client c{std::make_shared<FakeSession>(name), {}};
        relay.on_open(c.session, c.ctx);
        return c;
    }

    void send(Client& c, const json& frame) {
        relay.on_frame(c.session, c.ctx, frame.dump());
    }

    Client login(const std::string& addr) {
        Client c = connect(addr);
        send(c, {{"type", "auth"}, {"address", addr}});
        return c;
    }

    void disconnect(Client& c) {
        c.session->close();
        relay.on_close(c.session, c.ctx);
    }
};

json chat(const std::string& to, const std::string& id) {
    return {{"type", "message"}, {"to", to}, {"content", "hi"}, {"messageId", id}};
}

} // namespace

TEST_CASE("RelayManager - first frame must be auth", "[relay][auth]") {
    RelayHarness h;
    auto c = h.connect();

    SECTION("a non-auth frame closes the socket") {
        h.send(c, {{"type", "ping"}});
        REQUIRE(c.session->sent.size() == 1);
        CHECK(c.session->sent[0]["type"] == "error");
        CHECK(c.session->sent[0]["message"] == "Authentication required");
        CHECK_FALSE(c.session->is_open());
        CHECK(c.session->close_calls == 1);
        CHECK(c.session->abort_calls == 0);
        CHECK(c.ctx.state == ConnectionState::Closed);
    }
    SECTION("malformed JSON closes the socket") {
        h.relay.on_frame(c.session, c.ctx, "{not json");
        CHECK(c.session->of_type("error").size() == 1);
        CHECK_FALSE(c.session->is_open());
    }
    SECTION("auth without a valid address closes the socket") {
        h.send(c, {{"type", "auth"}, {"address", "0x123"}});
        CHECK(c.session->of_type("error").size() == 1);
        CHECK_FALSE(c.session->is_open());
        CHECK(h.relay.connection_count() == 0);
    }
    SECTION("frames after rejection are ignored") {
        h.send(c, {{"type", "ping"}});
        h.send(c, {{"type", "auth"}, {"address", kA}});
        CHECK(c.session->sent.size() == 1);
        CHECK(h.relay.connection_count() == 0);
    }
}

TEST_CASE("RelayManager - auth registers and acknowledges", "[relay][auth]") {
    RelayHarness h;
    auto c = h.connect();
    h.send(c, {{"type", "auth"}, {"address", "0xAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAA"}});

    REQUIRE(c.session->sent.size() == 1);
    CHECK(c.session->sent[0]["type"] == "auth_success");
    CHECK(c.session->sent[0]["address"] == kA);
    CHECK(c.session->sent[0]["timestamp"] == h.clock.now);
    CHECK(c.ctx.state == ConnectionState::Authenticated);
    CHECK(h.relay.is_online(kA));
    CHECK(h.relay.connection_count() == 1);
}

TEST_CASE("RelayManager - message to an offline recipient is queued", "[relay][routing]") {
    RelayHarness h;
    auto a = h.login(kA);

    h.send(a, {{"type", "message"}, {"to", "0xBBBBBBBBBBBBBBBBBBBBBBBBBBBBBBBBBBBBBBBB"},
               {"content", "hi"}, {"messageId", "m1"}});

    REQUIRE(h.queue.queue_size(kB) == 1);
    const auto queued = h.queue.peek(kB, 1)[0];
    CHECK(queued.from == kA);
    CHECK(queued.content == "hi");
    CHECK(queued.message_id == "m1");
    CHECK(queued.timestamp == h.clock.now);

    const auto acks = a.session->of_type("queued");
    REQUIRE(acks.size() == 1);
    CHECK(acks[0]["messageId"] == "m1");
    CHECK(acks[0]["to"] == kB);
}

TEST_CASE("RelayManager - message to an online recipient is delivered", "[relay][routing]") {
    RelayHarness h;
    auto a = h.login(kA);
    auto b = h.login(kB);

    h.send(a, {{"type", "message"}, {"to", kB}, {"content", "hi"}, {"messageId", "m1"}, {"timestamp", 123}});

    const auto inbound = b.session->of_type("message");
    REQUIRE(inbound.size() == 1);
    CHECK(inbound[0]["messageId"] == "m1");
    CHECK(inbound[0]["from"] == kA);
    CHECK(inbound[0]["content"] == "hi");
    CHECK(inbound[0]["timestamp"] == 123);
    CHECK_FALSE(inbound[0].contains("queued"));

    const auto acks = a.session->of_type("delivered");
    REQUIRE(acks.size() == 1);
    CHECK(acks[0]["messageId"] == "m1");
    CHECK(acks[0]["to"] == kB);
    CHECK(h.queue.queue_size(kB) == 0);
}

TEST_CASE("RelayManager - queued messages are pushed on auth", "[relay][routing]") {
    RelayHarness h;
    QueuedMessage first;
    first.from = kA;
    first.content = "one";
    first.message_id = "q1";
    first.timestamp = 10;
    QueuedMessage second = first;
    second.content = "two";
    second.message_id = "q2";
    second.timestamp = 20;
    h.queue.enqueue(kC, first);
    h.queue.enqueue(kC, second);

    auto c = h.login(kC);

    REQUIRE(c.session->sent.size() == 3);
    CHECK(c.session->sent[0]["type"] == "auth_success");
    CHECK(c.session->sent[1]["type"] == "message");
    CHECK(c.session->sent[1]["messageId"] == "q1");
    CHECK(c.session->sent[1]["queued"] == true);
    CHECK(c.session->sent[1]["timestamp"] == 10);
    CHECK(c.session->sent[2]["messageId"] == "q2");
    CHECK(c.session->sent[2]["queued"] == true);
    CHECK(h.queue.queue_size(kC) == 0);
}

TEST_CASE("RelayManager - idle connections are evicted by the heartbeat", "[relay][heartbeat]") {
    RelayHarness h;
    auto a = h.login(kA);
    auto b = h.login(kB);
    const int64_t timeout = 60 * 1000;

    h.clock.now += 40 * 1000;
    h.send(b, {{"type", "ping"}});
    h.clock.now += 30 * 1000;

    CHECK(h.relay.sweep_stale(h.clock.now, timeout) == 1);
    CHECK_FALSE(a.session->is_open());
    CHECK(a.session->abort_calls == 1);
    CHECK(a.session->close_calls == 0);
    CHECK_FALSE(h.relay.is_online(kA));
    CHECK(h.relay.is_online(kB));
    CHECK(h.relay.connection_count() == 1);

    // The read loop reports the close afterwards; nothing left to remove.
    h.relay.on_close(a.session, a.ctx);
    CHECK(h.relay.connection_count() == 1);
}

TEST_CASE("RelayManager - invalid message frames report an error", "[relay][protocol]") {
    RelayHarness h;
    auto a = h.login(kA);

    SECTION("missing content echoes the messageId") {
        h.send(a, {{"type", "message"}, {"to", kB}, {"messageId", "m9"}});
        const auto errors = a.session->of_type("error");
        REQUIRE(errors.size() == 1);
        CHECK(errors[0]["messageId"] == "m9");
    }
    SECTION("missing messageId omits it") {
        h.send(a, {{"type", "message"}, {"to", kB}, {"content", "x"}});
        const auto errors = a.session->of_type("error");
        REQUIRE(errors.size() == 1);
        CHECK_FALSE(errors[0].contains("messageId"));
    }
    SECTION("missing recipient") {
        h.send(a, {{"type", "message"}, {"content", "x"}, {"messageId", "m1"}});
        CHECK(a.session->of_type("error").size() == 1);
    }
    CHECK(h.queue.total_size() == 0);
    CHECK(a.session->is_open());
}

TEST_CASE("RelayManager - malformed frames after auth keep the connection", "[relay][protocol]") {
    RelayHarness h;
    auto a = h.login(kA);
    h.relay.on_frame(a.session, a.ctx, "[1, 2");
    h.relay.on_frame(a.session, a.ctx, "\"just a string\"");

    const auto errors = a.session->of_type("error");
    REQUIRE(errors.size() == 2);
    CHECK(errors[0]["message"] == "Failed to process message");
    CHECK(a.session->is_open());
    CHECK(h.relay.is_online(kA));
}

TEST_CASE("RelayManager - typing and read receipts are forwarded only when online", "[relay][presence]") {
    RelayHarness h;
    auto a = h.login(kA);

    h.send(a, {{"type", "typing"}, {"to", kB}, {"isTyping", true}});
    h.send(a, {{"type", "read_receipt"}, {"to", kB}, {"messageId", "m1"}});
    CHECK(h.queue.total_size() == 0);

    auto b = h.login(kB);
    h.send(a, {{"type", "typing"}, {"to", kB}, {"isTyping", true}});
    h.send(a, {{"type", "read_receipt"}, {"to", kB}, {"messageId", "m1"}});

    const auto typing = b.session->of_type("typing");
    REQUIRE(typing.size() == 1);
    CHECK(typing[0]["from"] == kA);
    CHECK(typing[0]["isTyping"] == true);

    const auto reads = b.session->of_type("read");
    REQUIRE(reads.size() == 1);
    CHECK(reads[0]["from"] == kA);
    CHECK(reads[0]["messageId"] == "m1");
    CHECK(reads[0]["timestamp"] == h.clock.now);
}

TEST_CASE("RelayManager - ping answers pong and refreshes activity", "[relay][heartbeat]") {
    RelayHarness h;
    auto a = h.login(kA);
    h.clock.now += 5000;
    h.send(a, {{"type", "ping"}});

    const auto pongs = a.session->of_type("pong");
    REQUIRE(pongs.size() == 1);
    CHECK(pongs[0]["timestamp"] == h.clock.now);
    CHECK(h.relay.last_activity(kA) == h.clock.now);
}

TEST_CASE("RelayManager - unknown frame types are ignored", "[relay][protocol]") {
    RelayHarness h;
    auto a = h.login(kA);
    const auto before = a.session->sent.size();
    h.send(a, {{"type", "presence_subscribe"}});
    h.send(a, {{"type", "auth"}, {"address", kB}});
    CHECK(a.session->sent.size() == before);
    CHECK_FALSE(h.relay.is_online(kB));
}

TEST_CASE("RelayManager - close removes the registration", "[relay][lifecycle]") {
    RelayHarness h;
    auto a = h.login(kA);
    h.disconnect(a);
    CHECK(h.relay.connection_count() == 0);
    CHECK(a.ctx.state == ConnectionState::Closed);

    auto b = h.login(kB);
    h.send(b, chat(kA, "m2"));
    CHECK(b.session->of_type("queued").size() == 1);
    CHECK(h.queue.queue_size(kA) == 1);
}

TEST_CASE("RelayManager - a second auth displaces the first session", "[relay][lifecycle]") {
    RelayHarness h;
    auto first = h.login(kA);
    auto second = h.login(kA);

    CHECK(h.relay.connection_count() == 1);
    CHECK(first.session->is_open());
    CHECK(first.session->close_calls == 0);
    CHECK(first.session->abort_calls == 0);

    auto b = h.login(kB);
    h.send(b, chat(kA, "m1"));
    CHECK(second.session->of_type("message").size() == 1);
    CHECK(first.session->of_type("message").empty());

    // The displaced socket closing must not unregister the new one.
    h.disconnect(first);
    CHECK(h.relay.is_online(kA));
}

TEST_CASE("RelayManager - a registered but closed recipient gets queued messages", "[relay][routing]") {
    RelayHarness h;
    auto a = h.login(kA);
    auto b = h.login(kB);
    b.session->close();

    h.send(a, chat(kB, "m1"));
    CHECK(a.session->of_type("queued").size() == 1);
    CHECK(h.queue.queue_size(kB) == 1);
    CHECK_FALSE(h.relay.is_online(kB));
}

TEST_CASE("RelayManager - close_all aborts every session", "[relay][lifecycle]") {
    RelayHarness h;
    auto a = h.login(kA);
    auto b = h.login(kB);
    h.relay.close_all();
    CHECK(h.relay.connection_count() == 0);
    CHECK_FALSE(a.session->is_open());
    CHECK_FALSE(b.session->is_open());
    CHECK(a.session->abort_calls == 1);
    CHECK(b.session->abort_calls == 1);
}
