#pragma once

#include <string>
#include <string_view>

namespace peerdrop {

inline constexpr std::string_view FALLBACK_NICKNAME = "Guest";

// Human-readable display name, "adjective-noun-NNNN".
// Returns FALLBACK_NICKNAME when no randomness is available.
std::string generate_nickname();

// Non-empty, at most 64 bytes, printable ASCII without spaces
bool is_valid_nickname(std::string_view nickname);

} // namespace peerdrop
