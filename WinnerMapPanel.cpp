#include "WinnerMapPanel.h"

#include "Log.h"
#include "OutcomeText.h"
#include "WinnerMapRenderer.h"

#include <cmath>

// extra distance (in pixels) beyond a dot's radius at which it still counts as being under the mouse.
constexpr double MouseOverSlack = 2.0;

namespace {
	bool sameHit(std::optional<DiagramHit> const& a, std::optional<DiagramHit> const& b) {
		if (!a || !b) return !a && !b;
		return a->label == b->label && a->shares.blue() == b->shares.blue() && a->shares.green() == b->shares.green();
	}
}

WinnerMapPanel::WinnerMapPanel(wxWindow* parent, wxWindowID id, WinnerMap map, int numThreads)
	: wxPanel(parent, id), map(std::move(map)), numThreads(numThreads)
{
	SetBackgroundStyle(wxBG_STYLE_PAINT);
	SetMinSize(diagramSize());

	Bind(wxEVT_PAINT, &WinnerMapPanel::OnPaint, this);
	Bind(wxEVT_MOTION, &WinnerMapPanel::OnMouseMove, this);
	Bind(wxEVT_LEAVE_WINDOW, &WinnerMapPanel::OnMouseLeave, this);
}

void WinnerMapPanel::setSettings(VisualiserSettings const& settings)
{
	// build the new map before replacing anything so a failure leaves the display intact
	WinnerMap newMap = buildWinnerMap(settings, numThreads);
	map = std::move(newMap);
	mouseOver.reset();
	updateToolTip();
	SetMinSize(diagramSize());
	paint();
}

void WinnerMapPanel::loadPointsOfInterest(std::string const& path)
{
	reloadPointsOfInterest(map, path);
	mouseOver.reset();
	updateToolTip();
	paint();
}

wxSize WinnerMapPanel::diagramSize() const
{
	int size = int(std::ceil(map.settings.width));
	return wxSize(size, size);
}

void WinnerMapPanel::paint() {
	wxClientDC dc(this);
	wxBufferedDC bdc(&dc, GetClientSize());
	render(bdc);
}

void WinnerMapPanel::OnPaint(wxPaintEvent& WXUNUSED(event))
{
	wxBufferedPaintDC dc(this);
	render(dc);
}

void WinnerMapPanel::OnMouseMove(wxMouseEvent& event)
{
	Point2D position(event.GetX(), event.GetY());
	auto hit = findDiagramHit(map, position, map.settings.radius + MouseOverSlack);
	if (sameHit(hit, mouseOver)) return;
	mouseOver = hit;
	updateToolTip();
	paint();
}

void WinnerMapPanel::OnMouseLeave(wxMouseEvent& WXUNUSED(event))
{
	if (!mouseOver) return;
	mouseOver.reset();
	updateToolTip();
	paint();
}

void WinnerMapPanel::updateToolTip()
{
	if (!mouseOver) {
		UnsetToolTip();
		return;
	}
	SetToolTip(describePoint(mouseOver->shares, mouseOver->result, mouseOver->label));
}

void WinnerMapPanel::render(wxDC& dc)
{
	WinnerMapRenderer::clearDC(dc);
	WinnerMapRenderer renderer(dc, map, GetClientSize(), mouseOver);
	renderer.render();
}
