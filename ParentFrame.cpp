#include "ParentFrame.h"

#include "EditFlowsFrame.h"
#include "Log.h"
#include "WinnerMapPanel.h"

// ----------------------------------------------------------------------------
// constants
// ----------------------------------------------------------------------------

const std::string AboutScreenText = std::string("Three Party Visualiser\n\n"
	"Shows who wins a single-member seat contested by three parties\n"
	"for every combination of first-preference votes, given the flow of preferences\n"
	"using ") + wxVERSION_STRING + std::string("\nunder ") + wxGetOsDescription() + ".";

const std::string AboutScreenTitle = "About Three Party Visualiser";

// IDs for the controls and the menu commands of the ParentFrame
enum class Item
{
	Base = 0, // To avoid mixing events with other frames, each frame's IDs have a unique value.
	EditFlows,
	LoadPoints = wxID_OPEN,

	// Item ID for exiting the program
	Exit = wxID_EXIT,

	// it is important for the id corresponding to the "About" command to have
	// this standard value as otherwise it won't be handled properly under Mac
	// (where it is special and put into the "Apple" menu)
	About = wxID_ABOUT
};

ParentFrame::ParentFrame(const wxString& title, WinnerMap map, int numThreads)
	: wxFrame(NULL, wxID_ANY, title, wxDefaultPosition, wxDefaultSize)
{
	mapPanel = new WinnerMapPanel(this, wxID_ANY, std::move(map), numThreads);
	setupMenuBar();
	bindEventHandlers();
	fitToDiagram();
}

void ParentFrame::OnExit(wxCommandEvent& WXUNUSED(event))
{
	// The argument is true in order to force the program to close.
	Close(true);
}

void ParentFrame::OnAbout(wxCommandEvent& WXUNUSED(event))
{
	// Displays a message box "about" the program.
	wxMessageBox(AboutScreenText, AboutScreenTitle, wxOK | wxICON_INFORMATION, this);
}

void ParentFrame::OnEditFlows(wxCommandEvent& WXUNUSED(event))
{
	auto callback = [this](VisualiserSettings settings) {applySettings(settings); };
	EditFlowsFrame* frame = new EditFlowsFrame(callback, mapPanel->getSettings());
	frame->ShowModal();
	// This is needed to avoid a memory leak.
	delete frame;
}

void ParentFrame::OnLoadPoints(wxCommandEvent& WXUNUSED(event))
{
	std::string pathName = receivePointsPathnameFromUser();
	if (pathName.empty()) return;
	try {
		mapPanel->loadPointsOfInterest(pathName);
	}
	catch (PointsOfInterestFileException const& e) {
		logger << e.what() << "\n";
		wxMessageBox(e.what(), "Could not load points of interest", wxOK | wxICON_ERROR, this);
	}
}

void ParentFrame::applySettings(VisualiserSettings settings)
{
	try {
		mapPanel->setSettings(settings);
	}
	catch (std::runtime_error const& e) {
		logger << "Could not apply settings: " << e.what() << "\n";
		wxMessageBox(e.what(), "Could not apply settings", wxOK | wxICON_ERROR, this);
		return;
	}
	fitToDiagram();
}

void ParentFrame::setupMenuBar()
{
	// Create the file menu.
	wxMenu *fileMenu = new wxMenu;
	fileMenu->Append(int(Item::LoadPoints), "&Load Points of Interest\tCtrl+O", "Load points of interest from a CSV file");
	fileMenu->Append(int(Item::Exit), "E&xit\tAlt-X", "Exit this program");

	// Create the edit menu.
	wxMenu *editMenu = new wxMenu;
	editMenu->Append(int(Item::EditFlows), "Edit &Flows\tCtrl+E", "Change the preference flows between parties");

	// Create the help menu.
	wxMenu *helpMenu = new wxMenu;
	helpMenu->Append(int(Item::About), "&About\tF1", "Show about dialog");

	// Append the freshly created menus to the menu bar.
	wxMenuBar *menuBar = new wxMenuBar();
	menuBar->Append(fileMenu, "&File");
	menuBar->Append(editMenu, "&Edit");
	menuBar->Append(helpMenu, "&Help");

	// Attach this menu bar to the frame.
	SetMenuBar(menuBar);
}

void ParentFrame::bindEventHandlers()
{
	// Bind events to the menus just added.
	Bind(wxEVT_COMMAND_MENU_SELECTED, &ParentFrame::OnEditFlows, this, int(Item::EditFlows));
	Bind(wxEVT_COMMAND_MENU_SELECTED, &ParentFrame::OnLoadPoints, this, int(Item::LoadPoints));
	Bind(wxEVT_COMMAND_MENU_SELECTED, &ParentFrame::OnAbout, this, int(Item::About));
	Bind(wxEVT_COMMAND_MENU_SELECTED, &ParentFrame::OnExit, this, int(Item::Exit));
}

void ParentFrame::fitToDiagram()
{
	SetClientSize(mapPanel->diagramSize());
	mapPanel->SetSize(GetClientSize());
	mapPanel->Refresh();
}

std::string ParentFrame::receivePointsPathnameFromUser()
{
	wxFileDialog openFileDialog(this, "Load Points of Interest", "", "",
		"CSV files (*.csv)|*.csv|All files (*.*)|*.*", wxFD_OPEN | wxFD_FILE_MUST_EXIST);

	// Don't do anything if the user cancels.
	if (openFileDialog.ShowModal() == wxID_CANCEL) return "";

	return openFileDialog.GetPath().ToStdString();
}
