#pragma once

// For compilers that support precompilation, includes "wx/wx.h".
#include "wx/wxprec.h"

#ifdef __BORLANDC__
#pragma hdrstop
#endif

// for all others, include the necessary headers (this file is usually all you
// need because it includes almost all "standard" wxWidgets headers)
#ifndef WX_PRECOMP
#include "wx/wx.h"
#endif

#include "VisualiserSettings.h"

#include <functional>
#include <memory>

class CheckInput;
class FloatInput;

// *** EditFlowsFrame ***
// Dialog that allows the user to change the preference flows between the three parties.
// In complementary mode only one flow per party can be edited; in independent mode all six can.
class EditFlowsFrame : public wxDialog
{
public:
	typedef std::function<void(VisualiserSettings)> OkCallback;

	// callback: function to be called when the OK button is pressed
	EditFlowsFrame(OkCallback callback, VisualiserSettings settings);

private:

	void createControls(int& y);

	// Each of these takes a value for the current y-position
	void createModeInput(int& y);
	void createRedInputs(int& y);
	void createGreenInputs(int& y);
	void createBlueInputs(int& y);

	void createOkCancelButtons(int& y);

	void setFinalWindowHeight(int y);

	// Enables the second flow from each party only when flows are independent
	void updateInterface();

	// Calls upon the window to send its data to the parent frame and close.
	void OnOK(wxCommandEvent& WXUNUSED(event));

	// Holds the preliminary settings, including the flows being edited.
	VisualiserSettings settings;

	bool independent;

	std::unique_ptr<CheckInput> independentInput;
	std::unique_ptr<FloatInput> redToGreenInput;
	std::unique_ptr<FloatInput> redToBlueInput;
	std::unique_ptr<FloatInput> greenToRedInput;
	std::unique_ptr<FloatInput> greenToBlueInput;
	std::unique_ptr<FloatInput> blueToRedInput;
	std::unique_ptr<FloatInput> blueToGreenInput;

	wxButton* okButton;
	wxButton* cancelButton;

	// function to call back to once the user clicks OK.
	OkCallback callback;
};
