#include "stacktrace_utils.hpp"

#include <any>

namespace librtprov::internal {

std::any capture_stacktrace() {
#ifdef LIBRTPROV_HAS_STACKTRACE
    return std::any(boost::stacktrace::stacktrace());
#else
    return {};
#endif
}

} // namespace librtprov::internal
