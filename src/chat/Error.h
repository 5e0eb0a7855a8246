#pragma once

#include <boost/system/error_code.hpp>

#include <type_traits>

namespace duochat {

// Domain failures. Stale unregister is deliberately absent: it is not an error.
enum class Errc {
    admission_conflict = 1,
    unauthenticated,
    malformed_envelope,
    unknown_envelope_kind,
    missing_recipient,
    transport_failure,
    backpressure_overflow,
    invalid_identity
};

const boost::system::error_category& duochat_category() noexcept;

boost::system::error_code make_error_code(Errc e) noexcept;

} // namespace duochat

namespace boost::system {

template <>
struct is_error_code_enum<duochat::Errc> : std::true_type {};

} // namespace boost::system
