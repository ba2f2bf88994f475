// Parses an http block with one upstream, appends a backend to it and prints
// the result.

#include <cstdlib>
#include <iostream>
#include <vector>

#include "Config.hpp"
#include "Logger.hpp"
#include "Parser.hpp"
#include "Renderer.hpp"
#include "Upstream.hpp"
#include "UpstreamServer.hpp"

int main() {
  try {
    Config conf = Parser::parseString(
        "http{\n"
        "  upstream my_backend{\n"
        "    server 127.0.0.1:443;\n"
        "    server 127.0.0.2:443 backup;\n"
        "  }\n"
        "}\n");

    std::vector<Upstream> upstreams = conf.findUpstreams();
    if (upstreams.empty()) {
      LOG(ERROR) << "no upstream found";
      return EXIT_FAILURE;
    }

    UpstreamServer server("127.0.0.1:443");
    server.setParameter("weight", "5");
    server.addFlag("down");
    upstreams[0].addServer(server);

    std::cout << Renderer(Style::indented()).render(conf);
    return EXIT_SUCCESS;
  } catch (const std::exception& e) {
    LOG(ERROR) << e.what();
    return EXIT_FAILURE;
  }
}
