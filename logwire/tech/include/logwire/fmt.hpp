#pragma once

// fmt as bundled with spdlog (external or embedded, depending on how spdlog was built).
#include <spdlog/fmt/fmt.h>  // IWYU pragma: export
#include <spdlog/fmt/ranges.h>  // IWYU pragma: export
