#pragma once

#include "Party.h"
#include "PreferenceFlows.h"
#include "VoteShares.h"
#include "WinnerResolver.h"

#include <string>

// e.g. "Greens: 30%, Labor: 45%, Coalition: 25%."
std::string describeShares(VoteShares const& shares);

// e.g. "Winner: Labor 62.5%" or "Winner: TIE"
std::string describeWinner(WinnerResult const& result);

// e.g. "Labor to Greens: 80.0%"
std::string describeFlow(Party from, Party to, PreferenceFlows const& flows);

// Full mouse-over text for a dot, or a labelled point of interest if "label" is non-empty
std::string describePoint(VoteShares const& shares, WinnerResult const& result, std::string const& label = "");
