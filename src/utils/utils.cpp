#include "utils.hpp"

#include <cctype>
#include <stdexcept>
#include <string>

#include "constants.hpp"

namespace {

bool startsWith(const std::string& s, const std::string& prefix) {
  return s.compare(0, prefix.size(), prefix) == 0;
}

}  // namespace

int parseLogLevelFlag(const std::string& arg) {
  if (!startsWith(arg, "-l:") || arg.size() != 4 ||
      !std::isdigit(static_cast<unsigned char>(arg[3]))) {
    throw std::invalid_argument("invalid log level flag '" + arg +
                                "' (expected -l:0, -l:1 or -l:2)");
  }
  int level = arg[3] - '0';
  if (level > 2) {
    throw std::invalid_argument("log level out of range in '" + arg +
                                "' (expected 0, 1 or 2)");
  }
  return level;
}

std::string parseStyleFlag(const std::string& arg) {
  if (!startsWith(arg, "-s:") || arg.size() == 3) {
    throw std::invalid_argument("invalid style flag '" + arg +
                                "' (expected -s:NAME)");
  }
  return arg.substr(3);
}

void processArgs(int argc, char** argv, std::string& path, int& logLevel,
                 std::string& styleName) {
  path = DEFAULT_CONFIG_PATH;
  logLevel = LOG_LEVEL;
  styleName = DEFAULT_STYLE_NAME;

  bool pathSeen = false;
  for (int i = 1; i < argc; ++i) {
    std::string arg(argv[i]);
    if (startsWith(arg, "-l")) {
      logLevel = parseLogLevelFlag(arg);
    } else if (startsWith(arg, "-s")) {
      styleName = parseStyleFlag(arg);
    } else if (!arg.empty() && arg[0] == '-') {
      throw std::invalid_argument("unknown option '" + arg + "'");
    } else if (pathSeen) {
      throw std::invalid_argument("more than one config path given ('" +
                                  path + "' and '" + arg + "')");
    } else {
      path = arg;
      pathSeen = true;
    }
  }
}
