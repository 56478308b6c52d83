#pragma once

#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace ferry {

namespace log = spdlog;

}  // namespace ferry
