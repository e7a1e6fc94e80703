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

#include <optional>

class WinnerMapRenderer {
public:
	// "highlight" is the dot or point of interest currently under the mouse, if any
	WinnerMapRenderer(wxDC& dc, WinnerMap const& map, wxSize dimensions, std::optional<DiagramHit> highlight = std::nullopt);

	void render();

	// clears the drawing area.
	static void clearDC(wxDC& dc);
private:

	struct DisplayVariables {
		float DCwidth;
		float DCheight;
		float dotRadius;
		float lineWidth;
	};

	void drawBackground() const;

	void drawDots() const;

	void drawBoundaries() const;

	void drawPointsOfInterest() const;

	void drawLegend() const;

	void drawYAxis() const;

	void drawXAxis() const;

	void drawArrowHead(wxPoint tip, wxPoint direction) const;

	wxColour winnerColour(WinnerResult const& result) const;

	// converts vote shares to a drawing position
	wxPoint toScreen(double blue, double green) const;

	// sets the brush and pen to a particular colour.
	void setBrushAndPen(wxColour currentColour) const;

	wxDC& dc;
	WinnerMap const& map;
	std::optional<DiagramHit> highlight;

	DisplayVariables dv;
};
