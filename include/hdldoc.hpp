#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <map>
#include <stdexcept>
#include <cstddef>

namespace hdldoc {

inline constexpr const char* kDefaultDataType = "wire";

enum class PortMode { Input, Output, Inout };

struct Port {
  std::string name;
  PortMode mode = PortMode::Input;
  std::string data_type = kDefaultDataType;
  std::optional<std::string> desc;
};

struct Parameter {
  std::string name;
  std::string mode = "in";
  std::string data_type = kDefaultDataType;
  std::optional<std::string> default_value;
  std::optional<std::string> desc;
};

struct SubModule {
  std::string module_type;
  std::string instance_name;
  std::map<std::string, std::string> port_connections;   // formal -> actual, verbatim
  std::optional<std::string> desc;
};

struct Module {
  std::string name;
  std::vector<Port> ports;                               // declaration order
  std::vector<Parameter> generics;
  std::map<std::string, std::vector<std::string>> sections;
  std::vector<SubModule> submodules;
  std::optional<std::string> desc;
  std::string summary() const;
};

using ModuleList = std::vector<Module>;

bool operator==(const Port& a, const Port& b);
bool operator==(const Parameter& a, const Parameter& b);
bool operator==(const SubModule& a, const SubModule& b);
bool operator==(const Module& a, const Module& b);
inline bool operator!=(const Port& a, const Port& b) { return !(a == b); }
inline bool operator!=(const Parameter& a, const Parameter& b) { return !(a == b); }
inline bool operator!=(const SubModule& a, const SubModule& b) { return !(a == b); }
inline bool operator!=(const Module& a, const Module& b) { return !(a == b); }

// ---------- errors ----------

struct parse_error : std::runtime_error { using std::runtime_error::runtime_error; };

// No tokenizer rule matches at offset().
struct lexical_error : parse_error {
  lexical_error(const std::string& what, std::size_t offset)
    : parse_error(what), offset_(offset) {}
  std::size_t offset() const { return offset_; }
private:
  std::size_t offset_;
};

// Text ended inside a nested lexer state, or a state stack was popped past its root.
struct structural_error : parse_error { using parse_error::parse_error; };

// The token stream asked for something the builder cannot apply.
struct builder_error : parse_error { using parse_error::parse_error; };

// ---------- parsing ----------

ModuleList parse_string(std::string_view text);
ModuleList parse_file(const std::string& path);

// Whole file as bytes, without a leading UTF-8 byte order mark.
// Throws parse_error when the file cannot be opened.
std::string read_source(const std::string& path);

bool is_verilog(const std::string& path);
bool is_array(const std::string& data_type);

// Whole-file cache in front of parse_file.
class Extractor {
public:
  const ModuleList& extract(const std::string& path);
  ModuleList extract_from_source(std::string_view text) const;
  bool cached(const std::string& path) const { return cache_.count(path) != 0; }
  void clear() { cache_.clear(); }
private:
  std::map<std::string, ModuleList> cache_;
};

// ---------- rendering ----------

std::string to_string(PortMode mode);
std::string to_string(const Port& port);
std::string to_string(const Parameter& param);
std::string to_string(const SubModule& sub);

} // namespace hdldoc
