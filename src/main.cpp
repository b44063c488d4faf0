#include "hdldoc.hpp"
#include "hdldoc_dialect.hpp"
#include <iostream>
#include <string>

static void dump_tokens(const std::string& text) {
  hdldoc::VerilogLexer lex(hdldoc::verilog_rules(), text);
  while (auto tok = lex.next()) {
    std::cout << tok->offset << " " << hdldoc::to_string(tok->action);
    for (const auto& g : tok->groups) std::cout << " [" << (g ? *g : std::string("-")) << "]";
    std::cout << "\n";
  }
}

int main(int argc, char** argv) {
  bool tokens = false;
  std::string path;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--tokens") tokens = true;
    else if (path.empty()) path = arg;
    else { path.clear(); break; }
  }
  if (path.empty()) { std::cerr << "Usage: vdoc [--tokens] <file.v>\n"; return 1; }
  try {
    if (tokens) dump_tokens(hdldoc::read_source(path));
    hdldoc::ModuleList modules = hdldoc::parse_file(path);
    std::cout << "Parsed modules: " << modules.size() << "\n";
    for (const auto& m : modules) { std::cout << m.summary() << "\n"; }
  } catch (const hdldoc::parse_error& e) {
    std::cerr << "Parse error: " << e.what() << "\n"; return 2;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n"; return 3;
  }
  return 0;
}
