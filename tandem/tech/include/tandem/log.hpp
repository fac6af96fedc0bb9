#pragma once

// All tandem logging goes through spdlog. Call sites use log::debug(...), log::error(...) etc.
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace tandem {

namespace log = spdlog;

}  // namespace tandem
