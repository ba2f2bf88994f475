#include "Renderer.hpp"

#include <sstream>

namespace {

// Nothing may follow a comment word on the same line
bool isCommentWord(const Parameter& p) {
  return p.fromComment;
}

// True when the lexer would not read `value` back as a single keyword
bool needsQuoting(const std::string& value) {
  if (value.empty()) {
    return true;
  }
  char first = value[0];
  if (first == '"' || first == '\'' || first == '`' || first == '}' ||
      first == '#') {
    return true;
  }
  for (size_t i = 0; i < value.size(); ++i) {
    char c = value[i];
    if (c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == ';' ||
        c == '{') {
      return true;
    }
  }
  return false;
}

std::string quote(const std::string& value, char delimiter) {
  std::string out(1, delimiter);
  for (size_t i = 0; i < value.size(); ++i) {
    char c = value[i];
    switch (c) {
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      case '\\':
        out += "\\\\";
        break;
      default:
        if (c == delimiter) {
          out += '\\';
        }
        out += c;
        break;
    }
  }
  out += delimiter;
  return out;
}

}  // namespace

Renderer::Renderer() : style_(Style::indented()) {}

Renderer::Renderer(const Style& style) : style_(style) {}

Renderer::Renderer(const Renderer& other) : style_(other.style_) {}

Renderer& Renderer::operator=(const Renderer& other) {
  if (this != &other) {
    style_ = other.style_;
  }
  return *this;
}

Renderer::~Renderer() {}

const Style& Renderer::style() const {
  return style_;
}

std::string Renderer::render(const Config& config) const {
  return render(config.root);
}

std::string Renderer::render(const BlockNode& block) const {
  std::ostringstream os;
  write(os, block);
  return os.str();
}

std::string Renderer::render(const DirectiveNode& directive) const {
  std::ostringstream os;
  writeDirective(os, directive, 0);
  return os.str();
}

void Renderer::write(std::ostream& os, const BlockNode& block) const {
  writeBlock(os, block, 0);
}

std::string Renderer::formatParameter(const Parameter& param) {
  if (param.isQuoted()) {
    return quote(param.value, param.quote);
  }
  if (isCommentWord(param)) {
    return param.value;
  }
  if (needsQuoting(param.value)) {
    return quote(param.value, '"');
  }
  return param.value;
}

void Renderer::writeIndent(std::ostream& os, std::size_t depth) const {
  if (style_.multiline) {
    os << std::string(depth * style_.indentWidth, ' ');
  }
}

void Renderer::writeBlock(std::ostream& os, const BlockNode& block,
                          std::size_t depth) const {
  for (size_t i = 0; i < block.directives.size(); ++i) {
    if (i > 0 && !style_.multiline) {
      os << ' ';
    }
    writeDirective(os, block.directives[i], depth);
  }
}

void Renderer::writeDirective(std::ostream& os, const DirectiveNode& d,
                              std::size_t depth) const {
  writeIndent(os, depth);

  if (d.isComment()) {
    os << (d.comment.empty() ? std::string("#") : "# " + d.comment) << '\n';
    return;
  }

  os << d.name;
  bool lineBroken = false;
  for (size_t i = 0; i < d.args.size(); ++i) {
    if (lineBroken) {
      os << '\n';
      writeIndent(os, depth + 1);
    } else {
      os << ' ';
    }
    os << formatParameter(d.args[i]);
    lineBroken = isCommentWord(d.args[i]);
  }
  if (lineBroken) {
    os << '\n';
    writeIndent(os, depth);
  }

  if (!d.hasBlock()) {
    os << ';';
    if (style_.multiline) {
      os << '\n';
    }
    return;
  }

  if (!style_.multiline) {
    os << (lineBroken ? "{" : " {");
    writeBlock(os, d.block(), depth + 1);
    os << '}';
    return;
  }

  if (style_.braceOnOwnLine && !lineBroken) {
    os << '\n';
    writeIndent(os, depth);
    os << "{\n";
  } else {
    os << (lineBroken ? "{\n" : " {\n");
  }
  writeBlock(os, d.block(), depth + 1);
  writeIndent(os, depth);
  os << "}\n";
}
