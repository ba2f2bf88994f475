#pragma once

#include <string>

// Parse log level flag (e.g., "-l:0" for DEBUG, "-l:1" for INFO, "-l:2" for
// ERROR). Throws std::invalid_argument on anything else.
int parseLogLevelFlag(const std::string& arg);

// Parse style flag (e.g., "-s:compact"). Only checks the shape of the flag;
// the name itself is checked by Style::fromName.
std::string parseStyleFlag(const std::string& arg);

// Parse program arguments and fill `path`, `logLevel` and `styleName`.
// Arguments that are not flags are the config path; at most one is allowed.
// Unset values keep the defaults from constants.hpp.
void processArgs(int argc, char** argv, std::string& path, int& logLevel,
                 std::string& styleName);
