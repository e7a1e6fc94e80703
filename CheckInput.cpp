#include "CheckInput.h"

CheckInput::CheckInput(wxWindow* parent, wxWindowID checkCtrlId, std::string labelText, bool initialValue, wxPoint topLeft,
	CheckChangeFunc checkChangeFunc, int labelWidth, int checkWidth)
	: checkChangeFunc(checkChangeFunc), parent(parent)
{
	staticText = new wxStaticText(parent, 0, labelText, topLeft, wxSize(labelWidth, Height));
	checkBox = new wxCheckBox(parent, checkCtrlId, "", topLeft + wxSize(labelWidth, 0), wxSize(checkWidth, Height));
	checkBox->SetValue(initialValue);

	parent->Bind(wxEVT_CHECKBOX, &CheckInput::updateCheck, this, checkBox->GetId());
}

void CheckInput::updateCheck(wxCommandEvent& event)
{
	checkChangeFunc(event.IsChecked());
}
