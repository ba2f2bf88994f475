#include "Style.hpp"

#include <stdexcept>

#include "constants.hpp"

Style::Style()
    : name(DEFAULT_STYLE_NAME),
      indentWidth(DEFAULT_INDENT_WIDTH),
      multiline(true),
      braceOnOwnLine(false) {}

Style::Style(const std::string& n, std::size_t width, bool lines,
             bool ownLine)
    : name(n), indentWidth(width), multiline(lines), braceOnOwnLine(ownLine) {}

Style Style::indented() {
  return Style("indented", DEFAULT_INDENT_WIDTH, true, false);
}

Style Style::compact() {
  return Style("compact", 0, false, false);
}

Style Style::allman() {
  return Style("allman", DEFAULT_INDENT_WIDTH, true, true);
}

Style Style::fromName(const std::string& name) {
  if (name == "indented") {
    return indented();
  }
  if (name == "compact") {
    return compact();
  }
  if (name == "allman") {
    return allman();
  }
  throw std::invalid_argument("unknown style '" + name +
                              "' (expected indented, compact or allman)");
}

std::vector<std::string> Style::names() {
  std::vector<std::string> n;
  n.push_back("indented");
  n.push_back("compact");
  n.push_back("allman");
  return n;
}
