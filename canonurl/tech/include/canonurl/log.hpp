#pragma once

// Logging facade: all library and example code logs through canonurl::log, backed by spdlog.
// Ensure header-only usage is forced locally without exporting SPDLOG_HEADER_ONLY
// as a public compile definition (avoids redefinition warnings if consumers also
// decide to force header-only or use the compiled lib variant).
#ifndef SPDLOG_HEADER_ONLY
#define SPDLOG_HEADER_ONLY
#endif
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace canonurl {

namespace log = spdlog;

}  // namespace canonurl
