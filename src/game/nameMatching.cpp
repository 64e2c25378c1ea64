#include "game/nameMatching.hpp"

#include <algorithm>
#include <cctype>

namespace whoisit::game {

namespace {

static char lowerChar(char c) {
	return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

static std::string joinTokens(const std::vector<std::string>& tokens) {
	std::string joined;
	for (const auto& token: tokens) {
		if (!joined.empty()) {
			joined += ' ';
		}
		joined += token;
	}
	return joined;
}

} // namespace

std::vector<std::string> nameTokens(const std::string_view name) {
	std::vector<std::string> tokens;
	std::string current;
	for (const char c: name) {
		if (std::isspace(static_cast<unsigned char>(c))) {
			if (!current.empty()) {
				tokens.push_back(std::move(current));
				current.clear();
			}
			continue;
		}
		current += lowerChar(c);
	}
	if (!current.empty()) {
		tokens.push_back(std::move(current));
	}
	return tokens;
}

std::string firstName(const std::string_view displayName) {
	const auto tokens = nameTokens(displayName);
	if (tokens.empty()) {
		return {};
	}
	std::string first = tokens.front();
	first.front()     = static_cast<char>(std::toupper(static_cast<unsigned char>(first.front())));
	return first;
}

bool matchesName(const std::string_view displayName, const std::string_view guess) {
	const auto guessTokens = nameTokens(guess);
	if (guessTokens.empty()) {
		return false;
	}

	const auto tokens = nameTokens(displayName);
	if (guessTokens.size() == 1u) {
		return std::find(tokens.begin(), tokens.end(), guessTokens.front()) != tokens.end();
	}
	return joinTokens(tokens) == joinTokens(guessTokens);
}

bool isNameDissimilar(const std::string_view a, const std::string_view b) {
	const auto tokensA = nameTokens(a);
	const auto tokensB = nameTokens(b);
	if (tokensA.empty() || tokensB.empty()) {
		return true;
	}
	return tokensA.front() != tokensB.front() && tokensA.front().front() != tokensB.front().front();
}

} // namespace whoisit::game
