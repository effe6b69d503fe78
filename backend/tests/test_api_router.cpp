#include <catch2/catch.hpp>
#include "api/api_router.h"
#include "relay/relay_manager.h"
#include "store/message_queue.h"
#include "store/public_key_store.h"
#include "helpers/fake_session.h"
#include <functional>
#include <memory>
#include <string>

using json = nlohmann::json;

namespace {

const std::string kAlice = "0x1234567890123456789012345678901234567890";
const std::string kBob   = "0x9876543210987654321098765432109876543210";

struct ApiHarness {
    FakeClock clock;
    MessageQueue queue{100, 168, std::ref(clock)};
    PublicKeyStore keys{std::ref(clock)};
    RelayManager relay{queue, std::ref(clock)};
    ApiRouter router{queue, keys, relay, std::ref(clock)};

    HttpResponse call(const std::string& method, const std::string& target, const std::string& body = {}) {
        const std::string head = method + " " + target + " HTTP/1.1\r\nHost: relay\r\n\r\n";
        HttpRequest req = parse_request_head(head);
        req.body = body;
        return router.handle(req);
    }

    void enqueue(const std::string& to, const std::string& id) {
        QueuedMessage m;
        m.from = kBob;
        m.content = "ciphertext";
        m.message_id = id;
        m.timestamp = clock.now;
        queue.enqueue(to, m);
    }
};

} // namespace

TEST_CASE("ApiRouter - health reports uptime, connections and queue size", "[api]") {
    ApiHarness h;
    h.enqueue(kAlice, "m1");
    auto session = std::make_shared<FakeSession>();
    ConnectionContext ctx;
    h.relay.on_open(session, ctx);
    h.relay.on_frame(session, ctx, json{{"type", "auth"}, {"address", kBob}}.dump());
    h.clock.now += 2500;

    const auto res = h.call("GET", "/health");
    REQUIRE(res.status == 200);
    CHECK(res.body["status"] == "ok");
    CHECK(res.body["connections"] == 1);
    CHECK(res.body["queuedMessages"] == 1);
    CHECK(res.body["uptime"].get<double>() == Approx(2.5));
}

TEST_CASE("ApiRouter - GET messages drains, or peeks with limit", "[api][messages]") {
    ApiHarness h;
    h.enqueue(kAlice, "m1");
    h.enqueue(kAlice, "m2");
    h.enqueue(kAlice, "m3");

    SECTION("limit peeks without draining") {
        const auto res = h.call("GET", "/api/messages/" + kAlice + "?limit=2");
        REQUIRE(res.status == 200);
        CHECK(res.body["count"] == 2);
        CHECK(res.body["messages"][0]["messageId"] == "m1");
        CHECK(h.queue.queue_size(kAlice) == 3);
    }
    SECTION("no limit drains") {
        const auto res = h.call("GET", "/api/messages/" + kAlice);
        REQUIRE(res.status == 200);
        CHECK(res.body["address"] == kAlice);
        CHECK(res.body["count"] == 3);
        CHECK(res.body["messages"][2]["messageId"] == "m3");
        CHECK(res.body["messages"][0]["from"] == kBob);
        CHECK(h.queue.queue_size(kAlice) == 0);
        CHECK(h.call("GET", "/api/messages/" + kAlice).body["count"] == 0);
    }
    SECTION("bad limit is rejected") {
        CHECK(h.call("GET", "/api/messages/" + kAlice + "?limit=abc").status == 400);
        CHECK(h.call("GET", "/api/messages/" + kAlice + "?limit=-1").status == 400);
        CHECK(h.queue.queue_size(kAlice) == 3);
    }
}

TEST_CASE("ApiRouter - malformed addresses are rejected with 400", "[api][validation]") {
    ApiHarness h;
    const auto res = h.call("GET", "/api/messages/0x12345");
    CHECK(res.status == 400);
    CHECK(res.body["error"] == "Invalid address format");
    CHECK(h.call("GET", "/api/messages/zz34567890123456789012345678901234567890/queue-size").status == 400);
    CHECK(h.call("DELETE", "/api/public-keys/0xnothex0000000000000000000000000000000000").status == 400);
    CHECK(h.call("GET", "/api/status/0x").status == 400);
}

TEST_CASE("ApiRouter - queue size, clear and stats", "[api][messages]") {
    ApiHarness h;
    const std::string upper = "0xABCDEFABCDEFABCDEFABCDEFABCDEFABCDEFABCD";
    h.enqueue(upper, "m1");

    auto size = h.call("GET", "/api/messages/" + upper + "/queue-size");
    CHECK(size.body["address"] == "0xabcdefabcdefabcdefabcdefabcdefabcdefabcd");
    CHECK(size.body["queueSize"] == 1);

    auto stats = h.call("GET", "/api/messages/stats/all");
    CHECK(stats.status == 200);
    CHECK(stats.body["totalMessages"] == 1);
    CHECK(stats.body["maxMessagesPerUser"] == 100);

    auto cleared = h.call("DELETE", "/api/messages/" + upper);
    CHECK(cleared.body["cleared"] == true);
    CHECK(cleared.body["message"] == "Queue cleared");
    auto again = h.call("DELETE", "/api/messages/" + upper);
    CHECK(again.body["cleared"] == false);
}

TEST_CASE("ApiRouter - public key CRUD", "[api][keys]") {
    ApiHarness h;

    auto stored = h.call("POST", "/api/public-keys",
                         json{{"address", kAlice}, {"publicKey", "alice-pk"}}.dump());
    REQUIRE(stored.status == 200);
    CHECK(stored.body["success"] == true);
    CHECK(stored.body["address"] == kAlice);

    auto fetched = h.call("GET", "/api/public-keys/" + kAlice);
    REQUIRE(fetched.status == 200);
    CHECK(fetched.body["publicKey"] == "alice-pk");
    CHECK(fetched.body["createdAt"] == h.clock.now);

    CHECK(h.call("HEAD", "/api/public-keys/" + kAlice).status == 200);
    CHECK(h.call("HEAD", "/api/public-keys/" + kBob).status == 404);
    CHECK(h.call("GET", "/api/public-keys/" + kBob).status == 404);

    auto batch = h.call("POST", "/api/public-keys/batch", json{{"addresses", {kAlice, kBob}}}.dump());
    REQUIRE(batch.status == 200);
    CHECK(batch.body["count"] == 1);
    CHECK(batch.body["keys"][kAlice]["publicKey"] == "alice-pk");

    auto stats = h.call("GET", "/api/public-keys/stats/all");
    CHECK(stats.body["totalKeys"] == 1);

    auto deleted = h.call("DELETE", "/api/public-keys/" + kAlice);
    CHECK(deleted.body["success"] == true);
    CHECK(h.call("DELETE", "/api/public-keys/" + kAlice).body["success"] == false);
}

TEST_CASE("ApiRouter - invalid key bodies are rejected", "[api][keys][validation]") {
    ApiHarness h;
    CHECK(h.call("POST", "/api/public-keys", "{oops").status == 400);
    CHECK(h.call("POST", "/api/public-keys", json{{"address", kAlice}}.dump()).status == 400);
    CHECK(h.call("POST", "/api/public-keys", json{{"address", kAlice}, {"publicKey", ""}}.dump()).status == 400);
    CHECK(h.call("POST", "/api/public-keys", json{{"address", "nope"}, {"publicKey", "k"}}.dump()).status == 400);
    CHECK(h.call("POST", "/api/public-keys/batch", json{{"addresses", json::array()}}.dump()).status == 400);
    CHECK(h.call("POST", "/api/public-keys/batch", json{{"addresses", {kAlice, "bad"}}}.dump()).status == 400);
    CHECK(h.keys.count() == 0);
}

TEST_CASE("ApiRouter - presence endpoints", "[api][status]") {
    ApiHarness h;
    auto session = std::make_shared<FakeSession>();
    ConnectionContext ctx;
    h.relay.on_open(session, ctx);
    h.relay.on_frame(session, ctx, json{{"type", "auth"}, {"address", kAlice}}.dump());

    auto one = h.call("GET", "/api/status/" + kAlice);
    CHECK(one.body["online"] == true);

    auto batch = h.call("POST", "/api/status/batch", json{{"addresses", {kAlice, kBob}}}.dump());
    CHECK(batch.body["statuses"][kAlice] == true);
    CHECK(batch.body["statuses"][kBob] == false);

    auto online = h.call("GET", "/api/status/online/all");
    CHECK(online.body["count"] == 1);
    CHECK(online.body["users"][0] == kAlice);
}

TEST_CASE("ApiRouter - unknown endpoints return 404", "[api]") {
    ApiHarness h;
    const auto res = h.call("GET", "/api/nothing");
    CHECK(res.status == 404);
    CHECK(res.body["error"]["message"] == "Endpoint not found");
    CHECK(res.body["error"]["path"] == "/api/nothing");
    CHECK(h.call("PUT", "/api/messages/" + kAlice).status == 404);
}

TEST_CASE("ApiRouter - HEAD answers like GET without side effects", "[api]") {
    ApiHarness h;
    h.enqueue(kAlice, "m1");
    h.enqueue(kAlice, "m2");

    SECTION("health") {
        const auto res = h.call("HEAD", "/health");
        CHECK(res.status == 200);
        CHECK(res.body["status"] == "ok");
    }
    SECTION("messages are peeked, not drained") {
        const auto res = h.call("HEAD", "/api/messages/" + kAlice);
        CHECK(res.status == 200);
        CHECK(res.body["count"] == 2);
        CHECK(h.queue.queue_size(kAlice) == 2);
    }
    SECTION("queue size and presence") {
        CHECK(h.call("HEAD", "/api/messages/" + kAlice + "/queue-size").status == 200);
        CHECK(h.call("HEAD", "/api/status/" + kBob).status == 200);
        CHECK(h.call("HEAD", "/api/status/bogus").status == 400);
    }
    SECTION("no GET route means 404") {
        CHECK(h.call("HEAD", "/api/nothing").status == 404);
        CHECK(h.call("HEAD", "/api/public-keys").status == 404);
    }
}
