#include "EditFlowsFrame.h"

#include "CheckInput.h"
#include "FloatInput.h"
#include "Log.h"
#include "Party.h"

constexpr int ControlPadding = 4;

// IDs for the controls and the menu commands
enum ControlId
{
	Base = 550, // To avoid mixing events with other frames.
	Ok,
	Independent,
	RedToGreen,
	RedToBlue,
	GreenToRed,
	GreenToBlue,
	BlueToRed,
	BlueToGreen
};

namespace {
	std::string flowLabel(Party from, Party to) {
		return partyName(from) + " to " + partyName(to) + ":";
	}
}

EditFlowsFrame::EditFlowsFrame(OkCallback callback, VisualiserSettings settings)
	: wxDialog(NULL, 0, "Edit Preference Flows", wxDefaultPosition, wxSize(420, 100 /* actual height set later */)),
	settings(settings), independent(settings.usesIndependentFlows()), callback(callback)
{
	// Independent flows need a concrete value for each partner, even if the user hasn't set one yet
	this->settings.redToBlue = settings.redToBlue.value_or(1.0 - settings.redToGreen);
	this->settings.greenToBlue = settings.greenToBlue.value_or(1.0 - settings.greenToRed);
	this->settings.blueToGreen = settings.blueToGreen.value_or(1.0 - settings.blueToRed);

	int currentY = ControlPadding;
	createControls(currentY);
	setFinalWindowHeight(currentY);
	updateInterface();
}

void EditFlowsFrame::createControls(int& y)
{
	createModeInput(y);
	createRedInputs(y);
	createGreenInputs(y);
	createBlueInputs(y);
	createOkCancelButtons(y);
}

void EditFlowsFrame::createModeInput(int& y)
{
	auto independentCallback = [this](bool checked) -> void {independent = checked; updateInterface(); };
	independentInput.reset(new CheckInput(this, ControlId::Independent, "Independent flows:", independent,
		wxPoint(2, y), independentCallback));
	y += independentInput->Height + ControlPadding;
}

void EditFlowsFrame::createRedInputs(int& y)
{
	auto redToGreenCallback = [this](double v) -> void {settings.redToGreen = v; };
	redToGreenInput.reset(new FloatInput(this, ControlId::RedToGreen, flowLabel(Party::Red, Party::Green),
		settings.redToGreen, wxPoint(2, y), redToGreenCallback));
	y += redToGreenInput->Height + ControlPadding;

	auto redToBlueCallback = [this](double v) -> void {settings.redToBlue = v; };
	redToBlueInput.reset(new FloatInput(this, ControlId::RedToBlue, flowLabel(Party::Red, Party::Blue),
		*settings.redToBlue, wxPoint(2, y), redToBlueCallback));
	y += redToBlueInput->Height + ControlPadding;
}

void EditFlowsFrame::createGreenInputs(int& y)
{
	auto greenToRedCallback = [this](double v) -> void {settings.greenToRed = v; };
	greenToRedInput.reset(new FloatInput(this, ControlId::GreenToRed, flowLabel(Party::Green, Party::Red),
		settings.greenToRed, wxPoint(2, y), greenToRedCallback));
	y += greenToRedInput->Height + ControlPadding;

	auto greenToBlueCallback = [this](double v) -> void {settings.greenToBlue = v; };
	greenToBlueInput.reset(new FloatInput(this, ControlId::GreenToBlue, flowLabel(Party::Green, Party::Blue),
		*settings.greenToBlue, wxPoint(2, y), greenToBlueCallback));
	y += greenToBlueInput->Height + ControlPadding;
}

void EditFlowsFrame::createBlueInputs(int& y)
{
	auto blueToRedCallback = [this](double v) -> void {settings.blueToRed = v; };
	blueToRedInput.reset(new FloatInput(this, ControlId::BlueToRed, flowLabel(Party::Blue, Party::Red),
		settings.blueToRed, wxPoint(2, y), blueToRedCallback));
	y += blueToRedInput->Height + ControlPadding;

	auto blueToGreenCallback = [this](double v) -> void {settings.blueToGreen = v; };
	blueToGreenInput.reset(new FloatInput(this, ControlId::BlueToGreen, flowLabel(Party::Blue, Party::Green),
		*settings.blueToGreen, wxPoint(2, y), blueToGreenCallback));
	y += blueToGreenInput->Height + ControlPadding;
}

void EditFlowsFrame::createOkCancelButtons(int& y)
{
	// Create the OK and cancel buttons.
	okButton = new wxButton(this, ControlId::Ok, "OK", wxPoint(67, y), wxSize(100, 24));
	cancelButton = new wxButton(this, wxID_CANCEL, "Cancel", wxPoint(233, y), wxSize(100, 24));

	// Bind events to the functions that should be carried out by them.
	Bind(wxEVT_BUTTON, &EditFlowsFrame::OnOK, this, Ok);
	y += FloatInput::Height + ControlPadding;
}

void EditFlowsFrame::setFinalWindowHeight(int y)
{
	SetClientSize(wxSize(GetClientSize().x, y));
}

void EditFlowsFrame::updateInterface()
{
	redToBlueInput->enable(independent);
	greenToBlueInput->enable(independent);
	blueToGreenInput->enable(independent);
}

void EditFlowsFrame::OnOK(wxCommandEvent& WXUNUSED(event)) {
	if (!independent) {
		settings.redToBlue.reset();
		settings.greenToBlue.reset();
		settings.blueToGreen.reset();
	}
	logger << "Preference flows edited, independent: " << (independent ? "yes" : "no") << "\n";
	callback(settings);
	Close();
}
