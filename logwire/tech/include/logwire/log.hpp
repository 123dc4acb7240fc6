#pragma once

// Force header-only usage locally without exporting SPDLOG_HEADER_ONLY as a public compile definition.
#ifndef SPDLOG_HEADER_ONLY
#define SPDLOG_HEADER_ONLY
#endif
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace logwire {

namespace log = spdlog;

}  // namespace logwire
