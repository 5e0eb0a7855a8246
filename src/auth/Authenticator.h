#pragma once

#include "auth/SessionStore.h"
#include "chat/Hub.h"

#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace duochat::auth {

using Request = boost::beast::http::request<boost::beast::http::string_body>;

// Admission collaborator: who is making this request, and are they already
// on a live connection.
class Authenticator {
public:
    virtual ~Authenticator() = default;

    virtual std::optional<std::string> authenticate(const Request& req) = 0;
    virtual bool is_registered(const std::string& identity) const = 0;
};

// Resolves the "session_id" cookie through a SessionStore.
class CookieAuthenticator : public Authenticator {
public:
    static constexpr std::string_view kCookieName = "session_id";

    CookieAuthenticator(SessionStore& sessions, const chat::Hub& hub);

    std::optional<std::string> authenticate(const Request& req) override;
    bool is_registered(const std::string& identity) const override;

    static std::optional<std::string> session_id_of(const Request& req);

private:
    SessionStore& sessions_;
    const chat::Hub& hub_;
};

} // namespace duochat::auth
