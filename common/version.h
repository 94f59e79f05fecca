#pragma once

namespace threadrunner {

inline constexpr const char *kVersion = "0.1.0";

} // namespace threadrunner
