#pragma once

namespace p4_mcp {
namespace ansi {

constexpr const char* kReset  = "\033[0m";
constexpr const char* kDim    = "\033[90m";
constexpr const char* kRed    = "\033[1;31m";
constexpr const char* kYellow = "\033[33m";
constexpr const char* kCyan   = "\033[36m";

} // namespace ansi
} // namespace p4_mcp
