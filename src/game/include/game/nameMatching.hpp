#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace whoisit::game {

//! Lower case, whitespace separated parts of a display name.
std::vector<std::string> nameTokens(std::string_view name);

//! First part of the display name in title case ("jane van dyke" -> "Jane"). Empty for an empty name.
std::string firstName(std::string_view displayName);

//! True if the guess names this person: one of the name parts, or the whole name, ignoring case and extra spaces.
bool matchesName(std::string_view displayName, std::string_view guess);

//! Decoy preference: different first name and different initial. Empty names count as dissimilar.
bool isNameDissimilar(std::string_view a, std::string_view b);

} // namespace whoisit::game
