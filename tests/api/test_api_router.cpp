/*
===============================================================================
 api::ApiRouter - HTTP Surface Tests
===============================================================================

Drives the router with in-memory beast requests; no sockets involved.

Covered:
- Login validation, cookie issuance, conflict with a live connection
- Session-gated endpoints: me, user search, conversations, history
- Logout: session dropped, live connection closed, cookie cleared
- Upgrade admission: unauthenticated vs already connected
- Routing fallbacks: 404, 405, plain GET on the WebSocket path
- Target helpers: path, query parameters, percent decoding
===============================================================================
*/

#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/beast/http.hpp>
#include <boost/json.hpp>

#include "api/ApiRouter.h"
#include "auth/Authenticator.h"
#include "auth/SessionStore.h"
#include "chat/Connection.h"
#include "chat/Error.h"
#include "chat/Hub.h"
#include "common/test_check.hpp"

using namespace duochat;
namespace http = boost::beast::http;
namespace json = boost::json;

namespace {

struct Fixture {
    boost::asio::io_context ioc;
    chat::Hub hub{ioc};
    auth::SessionStore sessions{std::chrono::hours(1)};
    auth::CookieAuthenticator authenticator{sessions, hub};
    api::ApiRouter router{hub, sessions, authenticator};
};

api::Request make(http::verb verb, const std::string& target, const std::string& cookie = {},
                  const std::string& body = {}) {
    api::Request req{verb, target, 11};
    if (!cookie.empty()) req.set(http::field::cookie, cookie);
    req.body() = body;
    req.prepare_payload();
    return req;
}

std::string header(const api::Response& res, http::field f) {
    auto it = res.find(f);
    if (it == res.end()) return {};
    return std::string(it->value().data(), it->value().size());
}

// "session_id=<value>" from a Set-Cookie header.
std::string cookie_of(const api::Response& res) {
    const std::string set = header(res, http::field::set_cookie);
    return set.substr(0, set.find(';'));
}

std::string login(Fixture& fx, const std::string& name) {
    auto res = fx.router.handle(make(http::verb::post, "/api/login", {}, R"({"username":")" + name + R"("})"));
    TEST_CHECK(res.result() == http::status::ok);
    return cookie_of(res);
}

std::string str(const json::value& v, const char* key) {
    return std::string(v.as_object().at(key).as_string().c_str());
}

} // namespace

void test_login() {
    std::cout << "[TEST] login\n";
    Fixture fx;

    auto res = fx.router.handle(make(http::verb::post, "/api/login", {}, R"({"username":"  alice "})"));
    TEST_CHECK(res.result() == http::status::ok);
    TEST_CHECK(header(res, http::field::content_type) == "application/json");
    auto body = json::parse(res.body());
    TEST_CHECK(str(body, "username") == "alice");
    TEST_CHECK(!body.as_object().at("online").as_bool());

    const std::string set = header(res, http::field::set_cookie);
    TEST_CHECK(set.rfind("session_id=sess-", 0) == 0);
    TEST_CHECK(set.find("Path=/") != std::string::npos);
    TEST_CHECK(set.find("Max-Age=3600") != std::string::npos);
    TEST_CHECK(set.find("HttpOnly") != std::string::npos);
    TEST_CHECK(set.find("SameSite=Strict") != std::string::npos);
    TEST_CHECK(fx.sessions.size() == 1);

    // Logging in again without a live connection is allowed.
    login(fx, "alice");
    TEST_CHECK(fx.sessions.size() == 2);

    std::cout << "[TEST] OK\n";
}

void test_login_rejections() {
    std::cout << "[TEST] login rejections\n";
    Fixture fx;

    auto res = fx.router.handle(make(http::verb::post, "/api/login", {}, "not json"));
    TEST_CHECK(res.result() == http::status::bad_request);
    TEST_CHECK(res.body() == "Invalid request body\n");

    res = fx.router.handle(make(http::verb::post, "/api/login", {}, R"({"username":7})"));
    TEST_CHECK(res.result() == http::status::bad_request);

    res = fx.router.handle(make(http::verb::post, "/api/login", {}, R"({"username":"   "})"));
    TEST_CHECK(res.result() == http::status::bad_request);
    TEST_CHECK(res.body() == "Username must be between 1 and 50 characters\n");

    res = fx.router.handle(make(http::verb::post, "/api/login", {}, R"({"username":"bad name!"})"));
    TEST_CHECK(res.result() == http::status::bad_request);
    TEST_CHECK(res.body() == "Username can only contain letters, numbers, and underscores\n");

    auto live = std::make_shared<chat::Connection>("alice", 8);
    fx.hub.register_connection(live);
    res = fx.router.handle(make(http::verb::post, "/api/login", {}, R"({"username":"alice"})"));
    TEST_CHECK(res.result() == http::status::conflict);
    TEST_CHECK(res.body() == "User already logged in from another device\n");
    TEST_CHECK(fx.sessions.size() == 0);

    std::cout << "[TEST] OK\n";
}

void test_me_and_auth_gate() {
    std::cout << "[TEST] session-gated endpoints\n";
    Fixture fx;

    for (const char* target : {"/api/me", "/api/users?search=a", "/api/conversations", "/api/conversations/bob"}) {
        auto res = fx.router.handle(make(http::verb::get, target));
        TEST_CHECK(res.result() == http::status::unauthorized);
        res = fx.router.handle(make(http::verb::get, target, "session_id=sess-forged"));
        TEST_CHECK(res.result() == http::status::unauthorized);
    }

    const std::string cookie = login(fx, "alice");
    auto res = fx.router.handle(make(http::verb::get, "/api/me", cookie));
    TEST_CHECK(res.result() == http::status::ok);
    auto body = json::parse(res.body());
    TEST_CHECK(str(body, "username") == "alice");
    TEST_CHECK(!body.as_object().at("online").as_bool());

    auto live = std::make_shared<chat::Connection>("alice", 8);
    fx.hub.register_connection(live);
    res = fx.router.handle(make(http::verb::get, "/api/me", cookie));
    TEST_CHECK(json::parse(res.body()).as_object().at("online").as_bool());

    std::cout << "[TEST] OK\n";
}

void test_search_and_history() {
    std::cout << "[TEST] user search and conversation history\n";
    Fixture fx;

    const std::string cookie = login(fx, "alice");
    auto alice = std::make_shared<chat::Connection>("alice", 64);
    auto bob = std::make_shared<chat::Connection>("bob", 64);
    auto bobby = std::make_shared<chat::Connection>("Bobby", 64);
    fx.hub.register_connection(alice);
    fx.hub.register_connection(bob);
    fx.hub.register_connection(bobby);
    fx.hub.unregister_connection(bobby);

    auto res = fx.router.handle(make(http::verb::get, "/api/users?search=BOB", cookie));
    TEST_CHECK(res.result() == http::status::ok);
    auto users = json::parse(res.body()).as_array();
    TEST_CHECK(users.size() == 2);
    TEST_CHECK(str(users[0], "username") == "Bobby");
    TEST_CHECK(!users[0].as_object().at("online").as_bool());
    TEST_CHECK(str(users[1], "username") == "bob");
    TEST_CHECK(users[1].as_object().at("online").as_bool());

    // Empty search lists everyone but the caller.
    res = fx.router.handle(make(http::verb::get, "/api/users", cookie));
    TEST_CHECK(json::parse(res.body()).as_array().size() == 2);

    fx.hub.route_message("alice", "bob", "hello bob");
    fx.hub.route_message("bob", "alice", "hi alice");

    res = fx.router.handle(make(http::verb::get, "/api/conversations", cookie));
    auto list = json::parse(res.body()).as_array();
    TEST_CHECK(list.size() == 1);
    TEST_CHECK(str(list[0], "peerUsername") == "bob");
    TEST_CHECK(str(list[0], "lastMessagePreview") == "hi alice");
    TEST_CHECK(list[0].as_object().at("peerOnline").as_bool());

    res = fx.router.handle(make(http::verb::get, "/api/conversations/bob", cookie));
    TEST_CHECK(res.result() == http::status::ok);
    auto history = json::parse(res.body()).as_array();
    TEST_CHECK(history.size() == 2);
    TEST_CHECK(str(history[0], "content") == "hello bob");
    TEST_CHECK(str(history[0], "status") == "delivered");
    TEST_CHECK(str(history[1], "from") == "bob");

    res = fx.router.handle(make(http::verb::get, "/api/conversations/nobody", cookie));
    TEST_CHECK(res.body() == "[]");

    res = fx.router.handle(make(http::verb::get, "/api/conversations/%20", cookie));
    TEST_CHECK(res.result() == http::status::bad_request);
    TEST_CHECK(res.body() == "Peer username required\n");

    std::cout << "[TEST] OK\n";
}

void test_logout() {
    std::cout << "[TEST] logout\n";
    Fixture fx;

    auto res = fx.router.handle(make(http::verb::post, "/api/logout"));
    TEST_CHECK(res.result() == http::status::unauthorized);
    TEST_CHECK(res.body() == "Not authenticated\n");

    res = fx.router.handle(make(http::verb::post, "/api/logout", "session_id=sess-forged"));
    TEST_CHECK(res.result() == http::status::unauthorized);
    TEST_CHECK(res.body() == "Invalid session\n");

    const std::string cookie = login(fx, "alice");
    const std::string other_device = login(fx, "alice");
    const std::string bob_cookie = login(fx, "bob");
    auto live = std::make_shared<chat::Connection>("alice", 8);
    fx.hub.register_connection(live);

    res = fx.router.handle(make(http::verb::post, "/api/logout", cookie));
    TEST_CHECK(res.result() == http::status::ok);
    TEST_CHECK(header(res, http::field::set_cookie).find("Max-Age=0") != std::string::npos);
    TEST_CHECK(live->queue().closed());
    TEST_CHECK(!fx.hub.is_connected("alice"));
    TEST_CHECK(fx.sessions.size() == 1);

    // Every session of the identity ends, other identities keep theirs.
    res = fx.router.handle(make(http::verb::get, "/api/me", cookie));
    TEST_CHECK(res.result() == http::status::unauthorized);
    res = fx.router.handle(make(http::verb::get, "/api/me", other_device));
    TEST_CHECK(res.result() == http::status::unauthorized);
    res = fx.router.handle(make(http::verb::get, "/api/me", bob_cookie));
    TEST_CHECK(res.result() == http::status::ok);

    std::cout << "[TEST] OK\n";
}

void test_admission() {
    std::cout << "[TEST] websocket admission\n";
    Fixture fx;

    std::string identity;
    auto req = make(http::verb::get, "/ws");
    auto ec = fx.router.admit(req, identity);
    TEST_CHECK(ec == make_error_code(Errc::unauthenticated));
    TEST_CHECK(identity.empty());
    auto res = fx.router.reject(req, ec);
    TEST_CHECK(res.result() == http::status::unauthorized);

    const std::string cookie = login(fx, "alice");
    req = make(http::verb::get, "/ws", cookie);
    ec = fx.router.admit(req, identity);
    TEST_CHECK(!ec);
    TEST_CHECK(identity == "alice");

    auto live = std::make_shared<chat::Connection>("alice", 8);
    fx.hub.register_connection(live);
    identity.clear();
    ec = fx.router.admit(req, identity);
    TEST_CHECK(ec == make_error_code(Errc::admission_conflict));
    res = fx.router.reject(req, ec);
    TEST_CHECK(res.result() == http::status::conflict);
    TEST_CHECK(res.body() == "User already has an active connection\n");

    std::cout << "[TEST] OK\n";
}

void test_routing_fallbacks() {
    std::cout << "[TEST] 404 / 405 / bare websocket path\n";
    Fixture fx;

    TEST_CHECK(fx.router.handle(make(http::verb::get, "/nope")).result() == http::status::not_found);
    TEST_CHECK(fx.router.handle(make(http::verb::get, "/api/login")).result() == http::status::method_not_allowed);
    TEST_CHECK(fx.router.handle(make(http::verb::post, "/api/me")).result() == http::status::method_not_allowed);
    TEST_CHECK(fx.router.handle(make(http::verb::delete_, "/api/conversations/bob")).result() ==
               http::status::method_not_allowed);
    TEST_CHECK(fx.router.handle(make(http::verb::get, "/ws")).result() == http::status::bad_request);

    std::cout << "[TEST] OK\n";
}

void test_target_helpers() {
    std::cout << "[TEST] path / query / decode helpers\n";
    using api::ApiRouter;

    TEST_CHECK(ApiRouter::path_of("/api/users?search=x") == "/api/users");
    TEST_CHECK(ApiRouter::path_of("/api/users") == "/api/users");

    TEST_CHECK(ApiRouter::query_param("/api/users?search=al", "search") == "al");
    TEST_CHECK(ApiRouter::query_param("/api/users?x=1&search=a%20b&y", "search") == "a b");
    TEST_CHECK(ApiRouter::query_param("/api/users?search", "search").empty());
    TEST_CHECK(ApiRouter::query_param("/api/users", "search").empty());
    TEST_CHECK(ApiRouter::query_param("/api/users?searching=1", "search").empty());

    TEST_CHECK(ApiRouter::url_decode("a+b%2Fc") == "a b/c");
    TEST_CHECK(ApiRouter::url_decode("100%") == "100%");
    TEST_CHECK(ApiRouter::url_decode("%zz") == "%zz");

    std::cout << "[TEST] OK\n";
}

int main() {
    test_login();
    test_login_rejections();
    test_me_and_auth_gate();
    test_search_and_history();
    test_logout();
    test_admission();
    test_routing_fallbacks();
    test_target_helpers();

    std::cout << "\n[GROUP] api router tests passed\n";
    return 0;
}
