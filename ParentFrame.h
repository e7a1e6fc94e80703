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

#include "WinnerMap.h"

class WinnerMapPanel;

class ParentFrame : public wxFrame
{
public:
	ParentFrame(const wxString& title, WinnerMap map, int numThreads);

private:

	// Calls on the frame to exit. This closes the whole program
	void OnExit(wxCommandEvent& event);

	// Calls on the frame to display an "About" message dialog.
	void OnAbout(wxCommandEvent& event);

	// Calls on the frame to open the dialog for editing preference flows.
	void OnEditFlows(wxCommandEvent& event);

	// Calls on the frame to open a dialog for selecting a points of interest file.
	void OnLoadPoints(wxCommandEvent& event);

	// Applies settings returned from the flows dialog
	void applySettings(VisualiserSettings settings);

	// Creates the menu bar (along the top of the window)
	void setupMenuBar();

	// Binds event handler routines to their respective controls
	void bindEventHandlers();

	// Resizes the frame so the whole diagram is visible
	void fitToDiagram();

	// Creates a dialog for the user to select a points of interest file
	std::string receivePointsPathnameFromUser();

	// The panel that displays the diagram. Owned by wxWidgets as a child window.
	WinnerMapPanel* mapPanel;
};
