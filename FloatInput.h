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

#include "InputGeneral.h"

#include <algorithm>

// Handles both a text box for numeric input and also a static text label that
// describes what the input is for.
class FloatInput {
public:
	typedef std::function<void(double)> TextChangeFunc;
	typedef std::function<double(double)> FloatValidationFunc;

	// public because the calling frame will want to know what height the control is
	static constexpr int Height = InputControlHeight;

	// Preference ratios and vote shares are all proportions
	static double DefaultValidator(double a) { return std::clamp(a, 0.0, 1.0); };

	FloatInput(wxWindow* parent, wxWindowID textCtrlId, std::string labelText, double initialValue, wxPoint topLeft,
		TextChangeFunc textChangeFunc = [](double) {return; }, FloatValidationFunc floatValidationFunc = DefaultValidator,
		int labelWidth = DefaultLabelWidth, int textInputWidth = DefaultInputWidth, int initialDecimalPlaces = 3);

	void enable(bool enabled);

private:

	// Calls upon the window to update the preliminary value based on
	// the result of the GetString() method of "event".
	void updateText(wxCommandEvent& event);

	std::string lastText;

	TextChangeFunc textChangeFunc;
	FloatValidationFunc floatValidationFunc;

	bool currentlyUpdating = false;

	wxWindow* parent;

	wxStaticText* staticText;
	wxTextCtrl* textCtrl;
};
