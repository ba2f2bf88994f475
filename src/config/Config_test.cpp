#include "Config.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "Http.hpp"
#include "Include.hpp"
#include "Logger.hpp"
#include "Parser.hpp"
#include "Server.hpp"

// Helper to create a temporary config file
class TempConfigFile {
 public:
  TempConfigFile(const std::string& content) {
    static int counter = 0;
    std::ostringstream oss;
    oss << "/tmp/ngxconf_test_" << counter++ << ".conf";
    path_ = oss.str();

    std::ofstream ofs(path_.c_str());
    ofs << content;
    ofs.close();
  }

  ~TempConfigFile() {
    std::remove(path_.c_str());
  }

  const std::string& path() const {
    return path_;
  }

 private:
  std::string path_;
};

namespace {

Config loadExample() {
  return Parser::parseFile(std::string(NGXCONF_CONF_DIR) + "/nginx.conf");
}

}  // namespace

// ==================== BASIC CONFIG STRUCTURE TESTS ====================

TEST(ConfigBasic, DefaultIsEmpty) {
  Config cfg;
  EXPECT_TRUE(cfg.filePath.empty());
  EXPECT_TRUE(cfg.root.empty());
  EXPECT_TRUE(cfg.findUpstreams().empty());
  EXPECT_TRUE(cfg.findDirectives("server").empty());
}

TEST(ConfigBasic, ParseFileRecordsPath) {
  TempConfigFile tmpFile("worker_processes 2;\n");
  Config cfg = Parser::parseFile(tmpFile.path());

  EXPECT_EQ(cfg.filePath, tmpFile.path());
  ASSERT_EQ(cfg.root.size(), 1u);
  EXPECT_EQ(cfg.root.directives[0].args[0].value, "2");
}

TEST(ConfigBasic, EmptyFileGivesEmptyTree) {
  TempConfigFile tmpFile("");
  Config cfg = Parser::parseFile(tmpFile.path());
  EXPECT_TRUE(cfg.root.empty());
}

TEST(ConfigBasic, CopyIsIndependent) {
  Config cfg = Parser::parseString("upstream a { server x:1; }");
  Config copy(cfg);
  copy.findUpstreams()[0].addServer(UpstreamServer("y:2"));

  EXPECT_EQ(cfg.findUpstreams()[0].servers().size(), 1u);
  EXPECT_EQ(copy.findUpstreams()[0].servers().size(), 2u);

  Config assigned;
  assigned = copy;
  EXPECT_EQ(assigned.root, copy.root);
}

TEST(ConfigBasic, DebugDumpDoesNotChangeTree) {
  Config cfg = Parser::parseString("# c\nevents { worker_connections 1; }");
  Config before(cfg);
  Logger::LogLevel saved = Logger::level();
  Logger::setLevel(Logger::DEBUG);
  cfg.debug();
  Logger::setLevel(saved);
  EXPECT_EQ(cfg.root, before.root);
}

// ==================== EXAMPLE DOCUMENT TESTS ====================

TEST(ConfigExample, TopLevel) {
  Config cfg = loadExample();

  ASSERT_EQ(cfg.root.size(), 9u);
  EXPECT_TRUE(cfg.root.directives[0].isComment());
  EXPECT_TRUE(cfg.root.directives[1].isComment());
  EXPECT_EQ(cfg.root.directives[2].name, "user");
  EXPECT_EQ(cfg.root.directives[7].name, "events");
  EXPECT_EQ(cfg.root.directives[8].kind, DirectiveNode::HTTP);
}

TEST(ConfigExample, HttpView) {
  Config cfg = loadExample();
  Http http(cfg.root.directives[8]);

  EXPECT_EQ(http.block().size(), 14u);
  EXPECT_EQ(http.servers().size(), 3u);
  ASSERT_EQ(http.upstreams().size(), 1u);
  EXPECT_EQ(http.upstreams()[0].name(), "big_server_com");
}

TEST(ConfigExample, ServerView) {
  Config cfg = loadExample();
  std::vector<Server> servers = Http(cfg.root.directives[8]).servers();
  ASSERT_EQ(servers.size(), 3u);

  EXPECT_TRUE(servers[0].block().directives[0].isComment());
  EXPECT_EQ(servers[0].block().directives[0].comment, "php/fastcgi");

  std::vector<std::string> names = servers[0].directiveArgs("server_name");
  ASSERT_EQ(names.size(), 2u);
  EXPECT_EQ(names[1], "www.domain1.com");
  EXPECT_TRUE(servers[0].directiveArgs("proxy_pass").empty());

  std::vector<Location> locations = servers[1].locations();
  ASSERT_EQ(locations.size(), 2u);
  EXPECT_EQ(locations[0].modifier(), "~");
  EXPECT_EQ(locations[0].match(),
            "^/(images|javascript|js|css|flash|media|static)/");
  EXPECT_EQ(locations[1].match(), "/");
}

TEST(ConfigExample, FindUpstreams) {
  Config cfg = loadExample();
  std::vector<Upstream> upstreams = cfg.findUpstreams();

  ASSERT_EQ(upstreams.size(), 1u);
  std::vector<UpstreamServer> servers = upstreams[0].servers();
  ASSERT_EQ(servers.size(), 4u);
  EXPECT_EQ(servers[0].address, "127.0.0.3:8000");
  EXPECT_EQ(servers[0].parameter("weight"), "5");
  EXPECT_TRUE(servers[3].parameters.empty());
}

TEST(ConfigExample, FindDirectives) {
  Config cfg = loadExample();

  EXPECT_EQ(cfg.findDirectives("listen").size(), 3u);
  EXPECT_EQ(cfg.findDirectives("location").size(), 4u);
  EXPECT_EQ(cfg.findDirectives("server").size(), 7u);
  EXPECT_TRUE(cfg.findDirectives("proxy_cache").empty());

  std::vector<DirectiveNode*> includes = cfg.findDirectives("include");
  ASSERT_EQ(includes.size(), 3u);
  EXPECT_EQ(includes[0]->kind, DirectiveNode::INCLUDE);
  EXPECT_EQ(Include(*includes[2]).path(), "fastcgi.conf");
}

TEST(ConfigExample, QuotedLogFormat) {
  Config cfg = loadExample();
  std::vector<DirectiveNode*> found = cfg.findDirectives("log_format");

  ASSERT_EQ(found.size(), 1u);
  ASSERT_EQ(found[0]->args.size(), 4u);
  EXPECT_EQ(found[0]->args[1].quote, '\'');
  EXPECT_EQ(found[0]->args[1].value,
            "$remote_addr - $remote_user [$time_local]  $status ");
}

TEST(ConfigQueries, FindUpstreamsAtEveryDepthInSourceOrder) {
  Config cfg = Parser::parseString(
      "http {\n"
      "  upstream u1 {}\n"
      "  server {\n"
      "    upstream u2 {}\n"
      "    location / { upstream u3 {} }\n"
      "  }\n"
      "}\n"
      "upstream u4 {}\n");

  std::vector<Upstream> upstreams = cfg.findUpstreams();
  ASSERT_EQ(upstreams.size(), 4u);
  EXPECT_EQ(upstreams[0].name(), "u1");
  EXPECT_EQ(upstreams[1].name(), "u2");
  EXPECT_EQ(upstreams[2].name(), "u3");
  EXPECT_EQ(upstreams[3].name(), "u4");
}
