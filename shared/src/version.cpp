#include "lanxfer/version.hpp"

namespace lanxfer {

const char* resolved_version() {
#if defined(LANXFER_VERSION)
    return LANXFER_VERSION;
#else
    return version().data();
#endif
}

} // namespace lanxfer
