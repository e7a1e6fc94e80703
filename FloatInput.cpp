#include "FloatInput.h"

#include "General.h"

FloatInput::FloatInput(wxWindow* parent, wxWindowID textCtrlId, std::string labelText, double initialValue, wxPoint topLeft,
	TextChangeFunc textChangeFunc, FloatValidationFunc floatValidationFunc, int labelWidth, int textInputWidth, int initialDecimalPlaces)
	: lastText(formatFloat(initialValue, initialDecimalPlaces)),
	textChangeFunc(textChangeFunc), floatValidationFunc(floatValidationFunc), parent(parent)
{
	staticText = new wxStaticText(parent, 0, labelText, topLeft, wxSize(labelWidth, Height));
	textCtrl = new wxTextCtrl(parent, textCtrlId, lastText, topLeft + wxSize(labelWidth, 0), wxSize(textInputWidth, Height));

	parent->Bind(wxEVT_TEXT, &FloatInput::updateText, this, textCtrl->GetId());
}

void FloatInput::enable(bool enabled)
{
	staticText->Enable(enabled);
	textCtrl->Enable(enabled);
}

void FloatInput::updateText(wxCommandEvent& event)
{
	if (currentlyUpdating) return;
	currentlyUpdating = true;
	double value = 0.0;
	std::string str = event.GetString().ToStdString();
	// This code effectively acts as a pseudo-validator
	// (can't get the standard one to work properly with pre-initialized values)
	try {
		// Partially typed numbers count as zero until they're complete
		if (str.empty() || str == "-" || str == ".") {
			value = 0.0;
		}
		else {
			value = parseDouble(str);
			double validated = floatValidationFunc(value);
			if (validated != value) {
				value = validated;
				textCtrl->ChangeValue(formatFloat(value, 3));
			}
		}
		// save this valid string in case the next text entry gives an error.
		lastText = str;
	}
	catch (std::logic_error const&) {
		// Set the text to the last valid string.
		textCtrl->ChangeValue(lastText);
		currentlyUpdating = false;
		return;
	}
	textChangeFunc(value);
	currentlyUpdating = false;
}
