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

#include "wx/dcbuffer.h"

#include "WinnerMap.h"

#include <optional>

// *** WinnerMapPanel ***
// Panel that displays the winner map and describes whatever is under the mouse pointer.
class WinnerMapPanel : public wxPanel
{
public:
	// "numThreads" is the number of threads used when the grid is recalculated
	WinnerMapPanel(wxWindow* parent, wxWindowID id, WinnerMap map, int numThreads);

	// Recalculates the map for new settings and repaints.
	// Throws InvalidSettingsException or PointsOfInterestFileException, leaving the current map in place.
	void setSettings(VisualiserSettings const& settings);

	// Throws PointsOfInterestFileException if the file can't be opened
	void loadPointsOfInterest(std::string const& path);

	VisualiserSettings const& getSettings() const { return map.settings; }

	// The client size needed to show the whole diagram
	wxSize diagramSize() const;

	// paints immediately if needed.
	void paint();

private:

	// Repaints the diagram
	void OnPaint(wxPaintEvent& event);

	// Handles the movement of the mouse in the panel.
	void OnMouseMove(wxMouseEvent& event);

	// Handles the mouse leaving the panel.
	void OnMouseLeave(wxMouseEvent& event);

	// updates the mouse-over tooltip to describe the current hit.
	void updateToolTip();

	void render(wxDC& dc);

	WinnerMap map;

	int numThreads;

	// The dot or point of interest that has the mouse over it.
	std::optional<DiagramHit> mouseOver;
};
