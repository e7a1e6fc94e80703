#pragma once

#include <string>

const std::string ConfigFilename = "ThreePartyVisualiser.cfg";

// Application-level settings read from a simple "key=value" file.
// A missing file or unrecognised lines leave the defaults in place.
class Config {
public:
	Config(std::string const& filename = ConfigFilename);
	int getSamplingThreads() const { return samplingThreads; }
	bool getFlushLog() const { return flushLog; }
	std::string const& getLogFile() const { return logFile; }
private:

	int samplingThreads = 1;
	bool flushLog = true;
	std::string logFile = "";
};
