#pragma once

#include <cstddef>
#include <string>
#include <vector>

// Formatting options for Renderer. The named styles are:
//   indented  one directive per line, 4 spaces per level, "name {"
//   compact   everything on one line, siblings separated by a space
//   allman    like indented, but '{' goes on its own line
struct Style {
  Style();
  Style(const std::string& name, std::size_t indentWidth, bool multiline,
        bool braceOnOwnLine);

  static Style indented();
  static Style compact();
  static Style allman();
  // Throws std::invalid_argument for an unknown style name
  static Style fromName(const std::string& name);
  static std::vector<std::string> names();

  std::string name;
  std::size_t indentWidth;  // spaces per nesting level
  bool multiline;           // one directive per line
  bool braceOnOwnLine;      // only meaningful when multiline
};
