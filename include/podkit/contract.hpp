#pragma once

#include <cstdlib>

#include "podkit/log/logger.hpp"

// ============================================================================
// Caller-contract checks
// ----------------------------------------------------------------------------
// A contract violation is a programming error (non power-of-two alignment,
// non UTF-8 text handed to an unchecked insert), never a data error. It is
// reported at Fatal level and terminates the process in every build type.
// Data errors are returned as podkit::Error instead.
// ============================================================================

namespace podkit {
namespace detail {

[[noreturn]] inline void contract_violation(const char* expr, const char* msg,
                                            const char* file, int line) noexcept {
    {
        PK_FATAL("[!!] contract violation: " << msg << " (" << expr << ") at " << file << ":" << line);
    }
    std::abort();
}

} // namespace detail
} // namespace podkit


#define PK_REQUIRE(expr, msg)                                                  \
    do {                                                                       \
        if (!(expr)) [[unlikely]] {                                            \
            ::podkit::detail::contract_violation(#expr, (msg), __FILE__, __LINE__); \
        }                                                                      \
    } while (0)
