// =============================================================================
// types.cpp - Library metadata and error code names
// =============================================================================

#include "clmath/types.hpp"

#define CLMATH_STR_(x) #x
#define CLMATH_STR(x) CLMATH_STR_(x)

namespace clmath {

const char* version() {
    return CLMATH_STR(CLMATH_VERSION_MAJOR) "."
           CLMATH_STR(CLMATH_VERSION_MINOR) "."
           CLMATH_STR(CLMATH_VERSION_PATCH);
}

const char* error_message(ErrorCode code) {
    switch (code) {
        case errors::OK: return "OK";
        case errors::ARITHMETIC_OVERFLOW: return "ARITHMETIC_OVERFLOW";
        case errors::AMOUNT_EXCEEDS_MAX_U64: return "AMOUNT_EXCEEDS_MAX_U64";
        default: return "UNKNOWN_ERROR";
    }
}

} // namespace clmath
