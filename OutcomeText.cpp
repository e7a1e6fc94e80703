#include "OutcomeText.h"

#include "General.h"

std::string describeShares(VoteShares const& shares)
{
	return partyName(Party::Green) + ": " + formatPercent(shares.green()) + ", "
		+ partyName(Party::Red) + ": " + formatPercent(shares.red()) + ", "
		+ partyName(Party::Blue) + ": " + formatPercent(shares.blue()) + ".";
}

std::string describeWinner(WinnerResult const& result)
{
	if (result.isTie()) return "Winner: TIE";
	return "Winner: " + partyName(*result.winner) + " " + formatPercent(result.margin);
}

std::string describeFlow(Party from, Party to, PreferenceFlows const& flows)
{
	return partyName(from) + " to " + partyName(to) + ": " + formatFloat(100.0 * flows.get(from, to), 1) + "%";
}

std::string describePoint(VoteShares const& shares, WinnerResult const& result, std::string const& label)
{
	std::string text;
	if (!label.empty()) text += label + "\n";
	text += describeShares(shares) + "\n" + describeWinner(result);
	return text;
}
