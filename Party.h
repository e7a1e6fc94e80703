#pragma once

#include <array>
#include <string>

// The three parties in the contest. Blue is plotted on the x-axis and Green on the y-axis,
// Red makes up the remainder of the vote.
enum class Party : unsigned char {
	Red,
	Green,
	Blue,
	Num
};

constexpr int NumParties = static_cast<int>(Party::Num);

constexpr std::array<Party, NumParties> AllParties = { Party::Red, Party::Green, Party::Blue };

struct PartyInfo {
	struct Colour {
		int r;
		int g;
		int b;
	};

	std::string name;
	Colour colour;
};

inline PartyInfo const& partyInfo(Party party) {
	static const std::array<PartyInfo, NumParties> Info = { {
		{ "Labor", { 221, 0, 68 } },
		{ "Greens", { 0, 170, 34 } },
		{ "Coalition", { 0, 136, 238 } },
	} };
	return Info[static_cast<int>(party)];
}

inline std::string const& partyName(Party party) { return partyInfo(party).name; }

constexpr int partyIndex(Party party) { return static_cast<int>(party); }

// Returns the party that is neither of the two given parties
constexpr Party remainingParty(Party a, Party b) {
	return static_cast<Party>(3 - partyIndex(a) - partyIndex(b));
}
