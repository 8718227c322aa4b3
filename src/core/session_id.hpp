#pragma once

#include <string_view>
#include <termpane/fwd.hpp>

namespace termpane
{

// Random (version 4) UUID in canonical lowercase form.
SessionId generate_session_id();

// True when text is a canonical 8-4-4-4-12 hex UUID (either case).
bool is_valid_session_id(std::string_view text);

// First eight hex digits, used for compact log output.
std::string short_session_id(std::string_view id);

}   // namespace termpane
