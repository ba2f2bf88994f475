#include <cstdlib>
#include <iostream>
#include <string>

#include "Config.hpp"
#include "Logger.hpp"
#include "ParseError.hpp"
#include "Parser.hpp"
#include "Renderer.hpp"
#include "Style.hpp"
#include "utils.hpp"

int main(int argc, char** argv) {
  // run `./ngxconf nginx.conf -l:N -s:STYLE`
  // log level: 0 = DEBUG, 1 = INFO, 2 = ERROR
  // style: indented, compact, allman

  std::string path;
  int logLevel;
  std::string styleName;

  // collect path, log level and style from argv
  Style style;
  try {
    processArgs(argc, argv, path, logLevel, styleName);
    style = Style::fromName(styleName);
  } catch (const std::exception& e) {
    LOG(ERROR) << "Error processing command-line arguments: " << e.what();
    std::cerr << "usage: " << argv[0]
              << " [config_path] [-l:0|1|2] [-s:indented|compact|allman]"
              << std::endl;
    return EXIT_FAILURE;
  }

  Logger::setLevel(static_cast<Logger::LogLevel>(logLevel));
  if (Logger::isEnabled(Logger::DEBUG)) {
    Logger::printStartupLevel();
  }

  try {
    Config cfg = Parser::parseFile(path);
    LOG(INFO) << "Configuration file parsed successfully";

    cfg.debug();

    Renderer renderer(style);
    renderer.write(std::cout, cfg.root);
    std::cout.flush();
    return EXIT_SUCCESS;
  } catch (const ParseError& e) {
    LOG(ERROR) << "Invalid configuration " << path << ": " << e.what();
    return EXIT_FAILURE;
  } catch (const std::exception& e) {
    LOG(ERROR) << "Error reading configuration: " << e.what();
    return EXIT_FAILURE;
  }
}
