#pragma once

#include "auth/Authenticator.h"
#include "auth/SessionStore.h"
#include "chat/Hub.h"

#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/system/error_code.hpp>

#include <string>
#include <string_view>

namespace duochat::api {

using Request  = auth::Request;
using Response = boost::beast::http::response<boost::beast::http::string_body>;

// The JSON surface next to the WebSocket endpoint: login/logout, "who am I",
// user search and conversation history. Also performs WebSocket admission.
class ApiRouter {
public:
    static constexpr std::string_view kWebSocketPath = "/ws";

    ApiRouter(chat::Hub& hub, auth::SessionStore& sessions, auth::Authenticator& auth);

    Response handle(const Request& req);

    // Decides whether `req` may be upgraded. On success `identity` is set.
    // Fails with unauthenticated or admission_conflict.
    boost::system::error_code admit(const Request& req, std::string& identity);

    // The HTTP answer for a failed admit().
    Response reject(const Request& req, boost::system::error_code ec) const;

    static std::string_view path_of(std::string_view target);
    static std::string query_param(std::string_view target, std::string_view name);
    static std::string url_decode(std::string_view s);

private:
    Response login(const Request& req);
    Response logout(const Request& req);
    Response me(const Request& req);
    Response search_users(const Request& req);
    Response conversations(const Request& req);
    Response conversation(const Request& req, std::string_view peer);

    Response json_response(const Request& req, std::string body) const;
    Response text_response(const Request& req, boost::beast::http::status status, std::string_view text) const;
    std::string session_cookie(const std::string& session_id) const;

    chat::Hub& hub_;
    auth::SessionStore& sessions_;
    auth::Authenticator& auth_;
};

} // namespace duochat::api
