#pragma once

#include <cstddef>
#include <ostream>
#include <string>

#include "BlockNode.hpp"
#include "Config.hpp"
#include "DirectiveNode.hpp"
#include "Style.hpp"

// Serializes a document tree back to configuration text.
//
// Parsing the output again yields a tree equal to the input (same names,
// parameter values, nesting and variants). Quoted parameters are re-quoted
// with their original delimiter; bare values that would not lex back as one
// word (a leading '#' included) are double-quoted. Comments, and comment
// words the parser kept as parameters, end their line in every style.
class Renderer {
 public:
  Renderer();
  explicit Renderer(const Style& style);
  Renderer(const Renderer& other);
  Renderer& operator=(const Renderer& other);
  ~Renderer();

  std::string render(const Config& config) const;
  std::string render(const BlockNode& block) const;
  std::string render(const DirectiveNode& directive) const;
  void write(std::ostream& os, const BlockNode& block) const;

  const Style& style() const;

  // The text a single parameter is written as
  static std::string formatParameter(const Parameter& param);

 private:
  void writeBlock(std::ostream& os, const BlockNode& block,
                  std::size_t depth) const;
  void writeDirective(std::ostream& os, const DirectiveNode& d,
                      std::size_t depth) const;
  void writeIndent(std::ostream& os, std::size_t depth) const;

  Style style_;
};
