#include "chat/Error.h"

#include <string>

namespace duochat {

namespace {

class Category : public boost::system::error_category {
public:
    const char* name() const noexcept override { return "duochat"; }

    std::string message(int val) const override {
        switch (static_cast<Errc>(val)) {
            case Errc::admission_conflict:    return "identity already has an active connection";
            case Errc::unauthenticated:       return "not authenticated";
            case Errc::malformed_envelope:    return "malformed envelope";
            case Errc::unknown_envelope_kind: return "unknown envelope kind";
            case Errc::missing_recipient:     return "envelope has no recipient";
            case Errc::transport_failure:     return "transport failure";
            case Errc::backpressure_overflow: return "outbound queue full";
            case Errc::invalid_identity:      return "invalid identity";
        }
        return "unknown duochat error";
    }
};

} // namespace

const boost::system::error_category& duochat_category() noexcept {
    static const Category category;
    return category;
}

boost::system::error_code make_error_code(Errc e) noexcept {
    return {static_cast<int>(e), duochat_category()};
}

} // namespace duochat
