#pragma once

#include <fmt/core.h>

namespace rdlink::compat {
    using fmt::format;
}
