#include "WinnerMapRenderer.h"

#include "General.h"
#include "OutcomeText.h"

#include <algorithm>
#include <cmath>

const wxColour BackgroundColour = wxColour(255, 255, 255);
const wxColour TieColour = wxColour(136, 136, 136);
const wxColour LineColour = wxColour(34, 34, 34);
const wxColour TextColour = wxColour(34, 34, 34);
const wxColour HighlightColour = wxColour(255, 255, 0);
const wxColour PointOfInterestBorderColour = wxColour(0, 0, 0);

// Dots are drawn as if at 60% opacity over the white background
constexpr float DotOpacity = 0.6f;
constexpr float PointOfInterestOpacity = 0.4f;

// Stroke widths as a proportion of the diagram width
constexpr float BoundaryLineProportion = 0.005f;
constexpr float PointOfInterestLineProportion = 0.002f;

// Axis line width as a proportion of the scale
constexpr float AxisLineProportion = 0.2f;

constexpr int LegendRightOffset = 12; // in multiples of the scale

inline wxFont font(int fontSize) {
	return wxFont(fontSize, wxFONTFAMILY_SWISS, wxFONTSTYLE_NORMAL, wxFONTWEIGHT_NORMAL);
}

namespace {
	wxColour blendWithBackground(wxColour colour, float opacity) {
		auto blend = [opacity](unsigned char channel, unsigned char background) {
			return static_cast<unsigned char>(std::lround(float(channel) * opacity + float(background) * (1.0f - opacity)));
		};
		return wxColour(blend(colour.Red(), BackgroundColour.Red()),
			blend(colour.Green(), BackgroundColour.Green()),
			blend(colour.Blue(), BackgroundColour.Blue()));
	}

	wxColour partyColour(Party party) {
		auto const& colour = partyInfo(party).colour;
		return wxColour(colour.r, colour.g, colour.b);
	}
}

WinnerMapRenderer::WinnerMapRenderer(wxDC& dc, WinnerMap const& map, wxSize dimensions, std::optional<DiagramHit> highlight)
	: dc(dc), map(map), highlight(highlight)
{
	dv.DCwidth = dimensions.GetWidth();
	dv.DCheight = dimensions.GetHeight();
	dv.dotRadius = std::max(float(map.settings.radius), 1.0f);
	dv.lineWidth = std::max(float(map.settings.width) * BoundaryLineProportion, 1.0f);
}

void WinnerMapRenderer::clearDC(wxDC& dc)
{
	dc.SetBackground(wxBrush(BackgroundColour));
	dc.Clear();
}

void WinnerMapRenderer::setBrushAndPen(wxColour currentColour) const {
	dc.SetBrush(wxBrush(currentColour));
	dc.SetPen(wxPen(currentColour));
}

wxPoint WinnerMapRenderer::toScreen(double blue, double green) const
{
	Point2D position = map.settings.diagramPosition(Point2D(blue, green));
	return wxPoint(int(std::lround(position.x)), int(std::lround(position.y)));
}

wxColour WinnerMapRenderer::winnerColour(WinnerResult const& result) const
{
	if (result.isTie()) return TieColour;
	return partyColour(*result.winner);
}

void WinnerMapRenderer::render() {

	drawBackground();

	drawDots();

	drawBoundaries();

	drawPointsOfInterest();

	drawLegend();

	drawYAxis();

	drawXAxis();
}

void WinnerMapRenderer::drawBackground() const
{
	wxRect backgroundRect = wxRect(0, 0, dv.DCwidth, dv.DCheight);
	setBrushAndPen(BackgroundColour);
	dc.DrawRectangle(backgroundRect);
}

void WinnerMapRenderer::drawDots() const
{
	for (auto const& dot : map.grid) {
		wxPoint centre = toScreen(dot.shares.blue(), dot.shares.green());
		// first draw the yellow outline for the dot under the mouse, if appropriate
		if (highlight && highlight->label.empty() && highlight->shares.blue() == dot.shares.blue()
			&& highlight->shares.green() == dot.shares.green()) {
			setBrushAndPen(HighlightColour);
			dc.DrawCircle(centre, int(std::ceil(dv.dotRadius)) + 2);
		}
		setBrushAndPen(blendWithBackground(winnerColour(dot.result), DotOpacity));
		dc.DrawCircle(centre, int(std::ceil(dv.dotRadius)));
	}
}

void WinnerMapRenderer::drawBoundaries() const
{
	dc.SetPen(wxPen(LineColour, int(std::ceil(dv.lineWidth))));
	for (auto const& boundary : map.boundaries.lines) {
		for (auto const& path : boundary.visiblePaths()) {
			std::vector<wxPoint> screenPath;
			for (auto const& vertex : path) screenPath.push_back(toScreen(vertex.x, vertex.y));
			dc.DrawLines(int(screenPath.size()), screenPath.data());
		}
	}
}

void WinnerMapRenderer::drawPointsOfInterest() const
{
	int borderWidth = std::max(int(std::lround(map.settings.width * PointOfInterestLineProportion)), 1);
	for (auto const& point : map.points) {
		Point2D shares(point.shares.blue(), point.shares.green());
		if (!map.settings.viewport().contains(shares, map.settings.step)) continue;
		wxPoint centre = toScreen(shares.x, shares.y);
		if (highlight && highlight->label == point.label && highlight->shares.blue() == shares.x
			&& highlight->shares.green() == shares.y) {
			setBrushAndPen(HighlightColour);
			dc.DrawCircle(centre, int(std::ceil(dv.dotRadius)) + 2 + borderWidth);
		}
		dc.SetBrush(wxBrush(blendWithBackground(winnerColour(point.result), PointOfInterestOpacity)));
		dc.SetPen(wxPen(PointOfInterestBorderColour, borderWidth));
		dc.DrawCircle(centre, int(std::ceil(dv.dotRadius)));
	}
}

void WinnerMapRenderer::drawLegend() const
{
	int scale = map.settings.scale;
	dc.SetFont(font(std::max(scale * 3 / 4, 6)));
	dc.SetTextForeground(TextColour);
	int x = int(map.settings.width) - scale * LegendRightOffset;
	int line = 0;
	auto drawFlow = [&](Party from, Party to) {
		dc.DrawText(describeFlow(from, to, map.flows), wxPoint(x, scale * (2 * line + 1)));
		++line;
	};
	drawFlow(Party::Red, Party::Green);
	drawFlow(Party::Green, Party::Red);
	drawFlow(Party::Blue, Party::Red);
	if (map.flows.mode() == PreferenceFlows::Mode::Independent) {
		drawFlow(Party::Red, Party::Blue);
		drawFlow(Party::Green, Party::Blue);
		drawFlow(Party::Blue, Party::Green);
	}
}

void WinnerMapRenderer::drawArrowHead(wxPoint tip, wxPoint direction) const
{
	int size = std::max(map.settings.scale / 2, 3);
	wxPoint across = wxPoint(-direction.y, direction.x);
	wxPoint base = tip - wxPoint(direction.x * size, direction.y * size);
	wxPoint points[3] = { tip, base + wxPoint(across.x * size / 2, across.y * size / 2),
		base - wxPoint(across.x * size / 2, across.y * size / 2) };
	setBrushAndPen(LineColour);
	dc.DrawPolygon(3, points);
}

void WinnerMapRenderer::drawYAxis() const
{
	auto const& settings = map.settings;
	int scale = settings.scale;
	int axisWidth = std::max(int(std::lround(scale * AxisLineProportion)), 1);
	int x0 = toScreen(settings.start, settings.stop).x;

	dc.SetPen(wxPen(LineColour, axisWidth));
	dc.DrawLine(x0, int(settings.width), x0, scale);
	drawArrowHead(wxPoint(x0, scale), wxPoint(0, -1));

	dc.SetFont(font(std::max(scale, 6)));
	dc.SetTextForeground(TextColour);
	std::string title = partyName(Party::Green) + " 3CP";
	wxSize titleSize = dc.GetTextExtent(title);
	dc.DrawRotatedText(title, x0 - (settings.offset - 1) * scale - titleSize.y,
		int(settings.width / 2.0) + titleSize.x / 2, 90.0);

	dc.SetFont(font(std::max(scale * 3 / 4, 6)));
	for (double mark : settings.marks) {
		if (mark <= settings.start || mark >= settings.stop) continue;
		wxPoint tick = toScreen(settings.start, mark);
		dc.SetPen(wxPen(LineColour, axisWidth));
		dc.DrawLine(tick, tick - wxPoint(scale, 0));
		std::string label = formatPercent(mark);
		wxSize labelSize = dc.GetTextExtent(label);
		dc.DrawText(label, tick.x - scale - labelSize.x - scale / 2, tick.y - labelSize.y / 2);
	}
}

void WinnerMapRenderer::drawXAxis() const
{
	auto const& settings = map.settings;
	int scale = settings.scale;
	int axisWidth = std::max(int(std::lround(scale * AxisLineProportion)), 1);
	int y0 = toScreen(settings.stop, settings.start).y;
	int x100 = toScreen(settings.stop, settings.start).x;

	dc.SetPen(wxPen(LineColour, axisWidth));
	dc.DrawLine(0, y0, x100, y0);
	drawArrowHead(wxPoint(x100, y0), wxPoint(1, 0));

	dc.SetFont(font(std::max(scale, 6)));
	dc.SetTextForeground(TextColour);
	std::string title = partyName(Party::Blue) + " 3CP";
	wxSize titleSize = dc.GetTextExtent(title);
	dc.DrawText(title, int(settings.width / 2.0) - titleSize.x / 2, y0 + scale * 5 / 2);

	dc.SetFont(font(std::max(scale * 3 / 4, 6)));
	for (double mark : settings.marks) {
		if (mark <= settings.start || mark >= settings.stop) continue;
		wxPoint tick = toScreen(mark, settings.start);
		dc.SetPen(wxPen(LineColour, axisWidth));
		dc.DrawLine(tick, tick + wxPoint(0, scale));
		std::string label = formatPercent(mark);
		wxSize labelSize = dc.GetTextExtent(label);
		dc.DrawText(label, tick.x - labelSize.x / 2, tick.y + scale + 2);
	}
}
