#include "game/nameMatching.hpp"

#include <gtest/gtest.h>

namespace whoisit::game {
namespace gtest {

TEST(NameMatchingUnit, Tokens_LowerCaseAndTrimmed) {
	EXPECT_EQ(nameTokens("  Jane   van DYKE "), (std::vector<std::string>{"jane", "van", "dyke"}));
	EXPECT_TRUE(nameTokens("").empty());
	EXPECT_TRUE(nameTokens(" \t ").empty());
}

TEST(NameMatchingUnit, FirstName_TitleCase) {
	EXPECT_EQ(firstName("jane van dyke"), "Jane");
	EXPECT_EQ(firstName("  ADA Lovelace"), "Ada");
	EXPECT_EQ(firstName(""), "");
}

TEST(NameMatchingUnit, AnyNamePart_Matches) {
	EXPECT_TRUE(matchesName("Jane van Dyke", "jane"));
	EXPECT_TRUE(matchesName("Jane van Dyke", "DYKE"));
	EXPECT_TRUE(matchesName("Jane van Dyke", " van "));
	EXPECT_FALSE(matchesName("Jane van Dyke", "jan"));
	EXPECT_FALSE(matchesName("Jane van Dyke", ""));
}

TEST(NameMatchingUnit, FullName_Matches) {
	EXPECT_TRUE(matchesName("Jane van Dyke", "jane  VAN dyke"));
	EXPECT_FALSE(matchesName("Jane van Dyke", "jane dyke"));
	EXPECT_FALSE(matchesName("Jane van Dyke", "dyke jane van"));
}

TEST(NameMatchingUnit, Dissimilar) {
	EXPECT_TRUE(isNameDissimilar("Ann Smith", "Bob Smith"));
	EXPECT_FALSE(isNameDissimilar("Ann Smith", "ann Brown"));
	EXPECT_FALSE(isNameDissimilar("Ann Smith", "Anna Jones")); // Same initial.
	EXPECT_TRUE(isNameDissimilar("", "Ann"));
}

} // namespace gtest
} // namespace whoisit::game
