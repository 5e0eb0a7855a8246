#include "api/ApiRouter.h"

#include "chat/Error.h"
#include "chat/User.h"
#include "protocol/Envelope.h"

#include <boost/beast/http/field.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/verb.hpp>
#include <boost/beast/version.hpp>
#include <boost/json.hpp>
#include <spdlog/spdlog.h>

#include <utility>

namespace duochat::api {

namespace http = boost::beast::http;
namespace json = boost::json;

namespace {

constexpr std::string_view kConversationsPrefix = "/api/conversations/";

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string_view target_of(const Request& req) {
    return std::string_view(req.target().data(), req.target().size());
}

} // namespace

ApiRouter::ApiRouter(chat::Hub& hub, auth::SessionStore& sessions, auth::Authenticator& auth)
    : hub_(hub), sessions_(sessions), auth_(auth) {}

Response ApiRouter::handle(const Request& req) {
    const std::string_view path = path_of(target_of(req));

    auto only = [&](http::verb verb) { return req.method() == verb; };
    auto not_allowed = [&] { return text_response(req, http::status::method_not_allowed, "Method not allowed"); };

    if (path == "/api/login")  return only(http::verb::post) ? login(req) : not_allowed();
    if (path == "/api/logout") return only(http::verb::post) ? logout(req) : not_allowed();
    if (path == "/api/me")     return only(http::verb::get) ? me(req) : not_allowed();
    if (path == "/api/users")  return only(http::verb::get) ? search_users(req) : not_allowed();
    if (path == "/api/conversations") return only(http::verb::get) ? conversations(req) : not_allowed();

    if (path.substr(0, kConversationsPrefix.size()) == kConversationsPrefix) {
        if (!only(http::verb::get)) return not_allowed();
        return conversation(req, path.substr(kConversationsPrefix.size()));
    }

    if (path == kWebSocketPath) {
        return text_response(req, http::status::bad_request, "WebSocket upgrade required");
    }

    return text_response(req, http::status::not_found, "Not found");
}

boost::system::error_code ApiRouter::admit(const Request& req, std::string& identity) {
    auto who = auth_.authenticate(req);
    if (!who) return make_error_code(Errc::unauthenticated);

    if (auth_.is_registered(*who)) {
        spdlog::info("[api] refusing second connection for {}", *who);
        return make_error_code(Errc::admission_conflict);
    }

    identity = std::move(*who);
    return {};
}

Response ApiRouter::reject(const Request& req, boost::system::error_code ec) const {
    if (ec == make_error_code(Errc::admission_conflict)) {
        return text_response(req, http::status::conflict, "User already has an active connection");
    }
    return text_response(req, http::status::unauthorized, "Not authenticated");
}

// ---- handlers ----

Response ApiRouter::login(const Request& req) {
    boost::system::error_code ec;
    json::value body = json::parse(req.body(), ec);
    const json::object* obj = ec ? nullptr : body.if_object();
    const json::value* name_value = obj ? obj->if_contains("username") : nullptr;
    if (!name_value || !name_value->is_string()) {
        return text_response(req, http::status::bad_request, "Invalid request body");
    }

    const json::string& raw = name_value->get_string();
    std::string username = chat::User::normalize_name(std::string(raw.data(), raw.size()));

    std::string why;
    if (!chat::User::is_valid_name(username, &why)) {
        spdlog::debug("[api] login rejected: {} ({})", make_error_code(Errc::invalid_identity).message(), why);
        return text_response(req, http::status::bad_request, why);
    }

    if (hub_.is_connected(username)) {
        return text_response(req, http::status::conflict, "User already logged in from another device");
    }

    const std::string session_id = sessions_.create(username);
    spdlog::info("[api] login {}", username);

    Response res = json_response(req, json::serialize(json::object{
        {"username", username},
        {"online", false}
    }));
    res.set(http::field::set_cookie, session_cookie(session_id));
    return res;
}

Response ApiRouter::logout(const Request& req) {
    auto session_id = auth::CookieAuthenticator::session_id_of(req);
    if (!session_id) return text_response(req, http::status::unauthorized, "Not authenticated");

    auto username = sessions_.find(*session_id);
    if (!username) return text_response(req, http::status::unauthorized, "Invalid session");

    hub_.disconnect(*username);
    sessions_.erase_user(*username);  // signs the identity out everywhere
    spdlog::info("[api] logout {}", *username);

    Response res = text_response(req, http::status::ok, "");
    res.set(http::field::set_cookie,
            std::string(auth::CookieAuthenticator::kCookieName) + "=; Path=/; Max-Age=0; HttpOnly");
    return res;
}

Response ApiRouter::me(const Request& req) {
    auto username = auth_.authenticate(req);
    if (!username) return text_response(req, http::status::unauthorized, "Not authenticated");

    auto presence = hub_.presence_of(*username);
    return json_response(req, json::serialize(json::object{
        {"username", *username},
        {"online", presence ? presence->online : false}
    }));
}

Response ApiRouter::search_users(const Request& req) {
    auto username = auth_.authenticate(req);
    if (!username) return text_response(req, http::status::unauthorized, "Not authenticated");

    const std::string query = query_param(target_of(req), "search");

    json::array out;
    for (const auto& user : hub_.search_identities(query, *username)) {
        out.push_back(protocol::to_json(user));
    }
    return json_response(req, json::serialize(out));
}

Response ApiRouter::conversations(const Request& req) {
    auto username = auth_.authenticate(req);
    if (!username) return text_response(req, http::status::unauthorized, "Not authenticated");

    json::array out;
    for (const auto& summary : hub_.list_conversations(*username)) {
        out.push_back(protocol::to_json(summary));
    }
    return json_response(req, json::serialize(out));
}

Response ApiRouter::conversation(const Request& req, std::string_view peer_raw) {
    auto username = auth_.authenticate(req);
    if (!username) return text_response(req, http::status::unauthorized, "Not authenticated");

    std::string peer = chat::User::normalize_name(url_decode(peer_raw));
    if (peer.empty()) return text_response(req, http::status::bad_request, "Peer username required");

    json::array out;
    for (const auto& message : hub_.get_conversation(*username, peer)) {
        out.push_back(protocol::to_json(message));
    }
    return json_response(req, json::serialize(out));
}

// ---- helpers ----

Response ApiRouter::json_response(const Request& req, std::string body) const {
    Response res{http::status::ok, req.version()};
    res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
    res.set(http::field::content_type, "application/json");
    res.keep_alive(req.keep_alive());
    res.body() = std::move(body);
    res.prepare_payload();
    return res;
}

Response ApiRouter::text_response(const Request& req, http::status status, std::string_view text) const {
    Response res{status, req.version()};
    res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
    res.set(http::field::content_type, "text/plain; charset=utf-8");
    res.keep_alive(req.keep_alive());
    res.body() = std::string(text);
    if (!text.empty()) res.body().push_back('\n');
    res.prepare_payload();
    return res;
}

std::string ApiRouter::session_cookie(const std::string& session_id) const {
    return std::string(auth::CookieAuthenticator::kCookieName) + "=" + session_id +
           "; Path=/; Max-Age=" + std::to_string(sessions_.ttl().count()) +
           "; HttpOnly; SameSite=Strict";
}

std::string_view ApiRouter::path_of(std::string_view target) {
    const auto q = target.find('?');
    return q == std::string_view::npos ? target : target.substr(0, q);
}

std::string ApiRouter::query_param(std::string_view target, std::string_view name) {
    const auto q = target.find('?');
    if (q == std::string_view::npos) return {};

    std::string_view query = target.substr(q + 1);
    while (!query.empty()) {
        const auto amp = query.find('&');
        std::string_view pair = query.substr(0, amp);
        query = amp == std::string_view::npos ? std::string_view{} : query.substr(amp + 1);

        const auto eq = pair.find('=');
        const std::string_view key = pair.substr(0, eq);
        if (url_decode(key) != name) continue;
        return eq == std::string_view::npos ? std::string{} : url_decode(pair.substr(eq + 1));
    }
    return {};
}

std::string ApiRouter::url_decode(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        const char c = s[i];
        if (c == '+') {
            out.push_back(' ');
        } else if (c == '%' && i + 2 < s.size() && hex_value(s[i + 1]) >= 0 && hex_value(s[i + 2]) >= 0) {
            out.push_back(static_cast<char>(hex_value(s[i + 1]) * 16 + hex_value(s[i + 2])));
            i += 2;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

} // namespace duochat::api
