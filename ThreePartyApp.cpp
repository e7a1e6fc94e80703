// Some preprocessor things to handle wxWidgets needs. Look at wxWidgets's "minimal"
// sample for details on why these are needed

#include "wx/wxprec.h"

#ifdef __BORLANDC__
  #pragma hdrstop
#endif

#ifndef WX_PRECOMP
  #include "wx/wx.h"
#endif

#include "wx/cmdline.h"

#include "Config.h"
#include "General.h"
#include "Log.h"
#include "ParentFrame.h"
#include "TextReport.h"
#include "WinnerMap.h"

#include <fstream>
#include <iostream>

namespace {
	const wxCmdLineEntryDesc CommandLineDesc[] =
	{
		{ wxCMD_LINE_SWITCH, "h", "help", "show this help message", wxCMD_LINE_VAL_NONE, wxCMD_LINE_OPTION_HELP },
		{ wxCMD_LINE_OPTION, nullptr, "red-to-green", "fraction of Labor preferences that flow to the Greens", wxCMD_LINE_VAL_DOUBLE },
		{ wxCMD_LINE_OPTION, nullptr, "green-to-red", "fraction of Greens preferences that flow to Labor", wxCMD_LINE_VAL_DOUBLE },
		{ wxCMD_LINE_OPTION, nullptr, "blue-to-red", "fraction of Coalition preferences that flow to Labor", wxCMD_LINE_VAL_DOUBLE },
		{ wxCMD_LINE_OPTION, nullptr, "red-to-blue", "fraction of Labor preferences that flow to the Coalition (independent flows)", wxCMD_LINE_VAL_DOUBLE },
		{ wxCMD_LINE_OPTION, nullptr, "green-to-blue", "fraction of Greens preferences that flow to the Coalition (independent flows)", wxCMD_LINE_VAL_DOUBLE },
		{ wxCMD_LINE_OPTION, nullptr, "blue-to-green", "fraction of Coalition preferences that flow to the Greens (independent flows)", wxCMD_LINE_VAL_DOUBLE },
		{ wxCMD_LINE_OPTION, nullptr, "start", "minimum X and Y axis value", wxCMD_LINE_VAL_DOUBLE },
		{ wxCMD_LINE_OPTION, nullptr, "stop", "maximum X and Y axis value", wxCMD_LINE_VAL_DOUBLE },
		{ wxCMD_LINE_OPTION, nullptr, "step", "resolution of the sampled dots", wxCMD_LINE_VAL_DOUBLE },
		{ wxCMD_LINE_OPTION, nullptr, "scale", "pixels per percent", wxCMD_LINE_VAL_NUMBER },
		{ wxCMD_LINE_OPTION, nullptr, "offset", "axis offset, in multiples of the scale", wxCMD_LINE_VAL_NUMBER },
		{ wxCMD_LINE_OPTION, nullptr, "marks", "comma-separated axis mark values", wxCMD_LINE_VAL_STRING },
		{ wxCMD_LINE_OPTION, "i", "input", "CSV file of points of interest, or - for standard input", wxCMD_LINE_VAL_STRING },
		{ wxCMD_LINE_OPTION, "r", "report", "write a text report to this file (- for standard output) instead of opening a window", wxCMD_LINE_VAL_STRING },
		wxCMD_LINE_DESC_END
	};
}

// This is wxWidgets's way of creating a new app: this class ThreePartyApp derives from
// the wxWidgets class wxApp; we then run the macro wxIMPLEMENT_APP below that
class ThreePartyApp : public wxApp
{
public:
	virtual bool OnInit() override;

	virtual int OnRun() override;

	virtual void OnInitCmdLine(wxCmdLineParser& parser) override;

	virtual bool OnCmdLineParsed(wxCmdLineParser& parser) override;

private:
	// Writes the text report and returns the process exit code
	int runReport();

	VisualiserSettings settings;

	int numThreads = 1;
};

wxIMPLEMENT_APP(ThreePartyApp);

void ThreePartyApp::OnInitCmdLine(wxCmdLineParser& parser)
{
	parser.SetDesc(CommandLineDesc);
	parser.SetSwitchChars("-");
}

bool ThreePartyApp::OnCmdLineParsed(wxCmdLineParser& parser)
{
	auto readDouble = [&](const char* name, double& target) {
		double value = 0.0;
		if (parser.Found(name, &value)) target = value;
	};
	auto readOptionalDouble = [&](const char* name, std::optional<double>& target) {
		double value = 0.0;
		if (parser.Found(name, &value)) target = value;
	};
	auto readInt = [&](const char* name, int& target) {
		long value = 0;
		if (parser.Found(name, &value)) target = int(value);
	};

	readDouble("red-to-green", settings.redToGreen);
	readDouble("green-to-red", settings.greenToRed);
	readDouble("blue-to-red", settings.blueToRed);
	readOptionalDouble("red-to-blue", settings.redToBlue);
	readOptionalDouble("green-to-blue", settings.greenToBlue);
	readOptionalDouble("blue-to-green", settings.blueToGreen);
	readDouble("start", settings.start);
	readDouble("stop", settings.stop);
	readDouble("step", settings.step);
	readInt("scale", settings.scale);
	readInt("offset", settings.offset);

	wxString text;
	if (parser.Found("marks", &text)) {
		try {
			settings.marks = splitStringD(text.ToStdString(), ",");
		}
		catch (std::logic_error const&) {
			parser.Usage();
			std::cerr << "Invalid axis marks: " << text.ToStdString() << "\n";
			return false;
		}
	}
	if (parser.Found("input", &text)) settings.input = text.ToStdString();
	if (parser.Found("report", &text)) settings.report = text.ToStdString();
	return true;
}

// 'Main program' equivalent: the program execution "starts" here (through wxIMPLEMENT_APP above)
bool ThreePartyApp::OnInit()
{
	Config config;
	if (!config.getLogFile().empty()) logger.redirect(config.getLogFile());
	logger.setFlushFlag(config.getFlushLog());
	numThreads = config.getSamplingThreads();

	// call the base class initialization method, which parses the command line
	// and fills in "settings" through OnCmdLineParsed
	if (!wxApp::OnInit())
		return false;

	// the report doesn't need a window, so it's written from OnRun instead
	if (!settings.report.empty()) return true;

	WinnerMap map;
	try {
		map = buildWinnerMap(settings, numThreads);
	}
	catch (std::runtime_error const& e) {
		logger << "Could not build winner map: " << e.what() << "\n";
		wxMessageBox(e.what(), "Three Party Visualiser", wxOK | wxICON_ERROR);
		return false;
	}

	// create the main application window
	// this stays around until the application is closed and is then deleted
	// (it's registered in the constructor of ParentFrame so wxWidgets knows about it)
	// we don't need to (and shouldn't) delete it ourselves
	ParentFrame* frame = new ParentFrame("Three Party Visualiser", std::move(map), numThreads);

	// now show it (the frames, unlike simple controls, are not shown when
	// created initially)
	frame->Show(true);

	// true means success: wxApp::OnRun() will be called which will enter the main message
	// loop and the application will run. If false was returned here, the
	// application would exit immediately.
	return true;
}

int ThreePartyApp::OnRun()
{
	if (!settings.report.empty()) return runReport();
	return wxApp::OnRun();
}

int ThreePartyApp::runReport()
{
	try {
		WinnerMap map = buildWinnerMap(settings, numThreads);
		if (settings.report == "-") {
			writeReport(std::cout, map.settings, map.flows, map.grid, map.boundaries, map.points);
		}
		else {
			std::ofstream file(settings.report);
			if (!file) {
				std::cerr << "Could not open report file: " << settings.report << "\n";
				return 1;
			}
			writeReport(file, map.settings, map.flows, map.grid, map.boundaries, map.points);
		}
	}
	catch (std::runtime_error const& e) {
		logger << "Could not write report: " << e.what() << "\n";
		std::cerr << e.what() << "\n";
		return 1;
	}
	logger << "Report written to " << settings.report << "\n";
	return 0;
}
