#include "Config.h"

#include "General.h"
#include "Log.h"

#include <algorithm>
#include <fstream>

Config::Config(std::string const& filename)
{
	std::ifstream file(filename);
	if (!file) {
		logger << "No config file found at " << filename << ", using defaults\n";
		return;
	}
	do {
		std::string line;
		std::getline(file, line);
		if (!file) break;
		line = trimString(line);
		if (line.empty() || line[0] == '#') continue;
		auto values = splitString(line, "=");
		if (values.size() != 2) {
			logger << "Invalid config line: " << line << "\n";
			continue;
		}
		std::string key = trimString(values[0]);
		std::string value = trimString(values[1]);
		try {
			if (key == "iSamplingThreads") {
				samplingThreads = std::max(1, std::stoi(value));
			}
			else if (key == "bFlushLog") {
				flushLog = std::stoi(value) != 0;
			}
			else if (key == "sLogFile") {
				logFile = value;
			}
			else {
				logger << "Unrecognised config key: " << key << "\n";
			}
		}
		catch (std::logic_error const&) {
			logger << "Invalid config line: " << line << "\n";
		}
	} while (true);
}
