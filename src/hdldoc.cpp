#include "hdldoc.hpp"
#include "hdldoc_builder.hpp"
#include "hdldoc_dialect.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <sstream>

namespace hdldoc {

namespace {

std::string describe_offset(std::string_view text, std::size_t offset) {
  offset = std::min(offset, text.size());
  std::size_t line = 1, col = 1;
  for (std::size_t i = 0; i < offset; ++i) {
    if (text[i] == '\n') { ++line; col = 1; }
    else ++col;
  }
  return "line " + std::to_string(line) + ", column " + std::to_string(col);
}

template<typename Error>
[[noreturn]] void rethrow_for_file(const Error& e, const std::string& path) {
  throw Error(path + ": " + e.what());
}

} // namespace

bool operator==(const Port& a, const Port& b) {
  return a.name == b.name && a.mode == b.mode && a.data_type == b.data_type && a.desc == b.desc;
}

bool operator==(const Parameter& a, const Parameter& b) {
  return a.name == b.name && a.mode == b.mode && a.data_type == b.data_type
      && a.default_value == b.default_value && a.desc == b.desc;
}

bool operator==(const SubModule& a, const SubModule& b) {
  return a.module_type == b.module_type && a.instance_name == b.instance_name
      && a.port_connections == b.port_connections && a.desc == b.desc;
}

bool operator==(const Module& a, const Module& b) {
  return a.name == b.name && a.ports == b.ports && a.generics == b.generics
      && a.sections == b.sections && a.submodules == b.submodules && a.desc == b.desc;
}

ModuleList parse_string(std::string_view text) {
  VerilogLexer lex(verilog_rules(), text);
  EntityBuilder builder;
  try {
    while (auto tok = lex.next()) builder.apply(*tok);
  } catch (const lexical_error& e) {
    throw lexical_error(describe_offset(text, e.offset()) + ": no rule matches in state '"
                        + to_string(lex.state()) + "'", e.offset());
  }
  if (lex.depth() != 1)
    throw structural_error(describe_offset(text, text.size()) + ": input ends inside state '"
                           + to_string(lex.state()) + "'");
  return builder.finish();
}

std::string read_source(const std::string& path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) throw parse_error("could not open file: " + path);
  std::string content((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
  if (content.compare(0, 3, "\xEF\xBB\xBF") == 0) content.erase(0, 3);
  return content;
}

ModuleList parse_file(const std::string& path) {
  const std::string content = read_source(path);
  try {
    return parse_string(content);
  } catch (const lexical_error& e) {
    throw lexical_error(path + ": " + e.what(), e.offset());
  } catch (const structural_error& e) {
    rethrow_for_file(e, path);
  } catch (const builder_error& e) {
    rethrow_for_file(e, path);
  }
}

bool is_verilog(const std::string& path) {
  auto slash = path.find_last_of("/\\");
  auto dot = path.rfind('.');
  // a leading dot names a hidden file, not an extension
  const std::size_t stem = (slash == std::string::npos) ? 0 : slash + 1;
  if (dot == std::string::npos || dot <= stem) return false;
  std::string ext = path.substr(dot);
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return ext == ".v" || ext == ".vlog";
}

bool is_array(const std::string& data_type) {
  return data_type.find('[') != std::string::npos;
}

// ---------- Extractor ----------

const ModuleList& Extractor::extract(const std::string& path) {
  auto it = cache_.find(path);
  if (it != cache_.end()) return it->second;
  ModuleList modules = parse_file(path);
  return cache_.emplace(path, std::move(modules)).first->second;
}

ModuleList Extractor::extract_from_source(std::string_view text) const {
  return parse_string(text);
}

// ---------- rendering ----------

std::string to_string(PortMode mode) {
  switch (mode) {
    case PortMode::Input:  return "input";
    case PortMode::Output: return "output";
    case PortMode::Inout:  return "inout";
  }
  return "input";
}

std::string to_string(const Port& port) {
  return port.name + " : " + to_string(port.mode) + " " + port.data_type;
}

std::string to_string(const Parameter& param) {
  std::string s = param.name + " : " + param.data_type;
  if (param.default_value) s += " := " + *param.default_value;
  return s;
}

std::string to_string(const SubModule& sub) {
  return sub.instance_name + " (" + sub.module_type + ")";
}

std::string Module::summary() const {
  std::ostringstream oss;
  oss << "module " << name << "\n";
  if (desc) oss << "  description: " << *desc << "\n";
  oss << "  parameters:\n";
  for (const auto& p : generics) {
    oss << "    " << to_string(p) << "\n";
    if (p.desc) oss << "      " << *p.desc << "\n";
  }
  oss << "  ports:\n";
  for (const auto& p : ports) {
    oss << "    " << to_string(p) << "\n";
    if (p.desc) oss << "      " << *p.desc << "\n";
  }
  oss << "  submodules:\n";
  for (const auto& s : submodules) {
    oss << "    " << to_string(s) << "\n";
    for (const auto& c : s.port_connections) oss << "      ." << c.first << "(" << c.second << ")\n";
  }
  if (!sections.empty()) {
    oss << "  sections:\n";
    for (const auto& sec : sections) {
      oss << "    " << sec.first << ":";
      for (const auto& p : sec.second) oss << " " << p;
      oss << "\n";
    }
  }
  oss << "endmodule\n";
  return oss.str();
}

} // namespace hdldoc
