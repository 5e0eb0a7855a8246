#include "auth/Authenticator.h"

#include <boost/beast/http/field.hpp>

namespace duochat::auth {

namespace http = boost::beast::http;

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

} // namespace

CookieAuthenticator::CookieAuthenticator(SessionStore& sessions, const chat::Hub& hub)
    : sessions_(sessions), hub_(hub) {}

std::optional<std::string> CookieAuthenticator::authenticate(const Request& req) {
    auto id = session_id_of(req);
    if (!id) return std::nullopt;
    return sessions_.find(*id);
}

bool CookieAuthenticator::is_registered(const std::string& identity) const {
    return hub_.is_connected(identity);
}

std::optional<std::string> CookieAuthenticator::session_id_of(const Request& req) {
    auto it = req.find(http::field::cookie);
    if (it == req.end()) return std::nullopt;

    std::string_view header(it->value().data(), it->value().size());
    while (!header.empty()) {
        const auto semi = header.find(';');
        std::string_view pair = trim(header.substr(0, semi));
        header = semi == std::string_view::npos ? std::string_view{} : header.substr(semi + 1);

        const auto eq = pair.find('=');
        if (eq == std::string_view::npos) continue;
        if (trim(pair.substr(0, eq)) != kCookieName) continue;

        std::string_view value = trim(pair.substr(eq + 1));
        if (value.empty()) return std::nullopt;
        return std::string(value);
    }
    return std::nullopt;
}

} // namespace duochat::auth
