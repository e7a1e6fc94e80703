#include "Log.h"

const std::string DefaultLogFileName = "ThreePartyVisualiser.log";

// This is exposed by the "Log.h" file as an external variable
Logger logger;

Logger::Logger()
	: filename_(DefaultLogFileName), fileStream_(DefaultLogFileName)
{
	resetLog();
}

void Logger::redirect(std::string const& filename) {
	if (filename == filename_) return;
	fileStream_.close();
	filename_ = filename;
	fileStream_.open(filename_);
	resetLog();
}

void Logger::resetLog() {
	*this << "--- Logging initialized ---\n";
}
