#pragma once
#include "hdldoc.hpp"
#include "hdldoc_dialect.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace hdldoc {

// Turns the Verilog token stream into finalized modules, one token at a time.
// A builder serves exactly one parse.
class EntityBuilder {
public:
  void apply(const VerilogToken& tok);

  // Hands over every closed module. Throws structural_error when a module is still open.
  ModuleList finish();

private:
  // Everything that belongs to the module being built; moved into a Module on close.
  struct ModuleContext {
    std::string name;
    std::vector<Port> ports;
    std::unordered_map<std::string, std::size_t> port_index;
    std::vector<Parameter> generics;
    std::vector<std::pair<std::size_t, std::string>> breakpoints;   // (port count, label)
    std::vector<SubModule> submodules;
    std::optional<SubModule> pending_submodule;
    std::vector<std::string> desc_lines;
  };

  enum class ItemKind { None, Port, Parameter };

  void on_module_start(const VerilogToken& tok);
  void on_end_module();
  void on_parameter_start(const VerilogToken& tok);
  void on_param_item(const VerilogToken& tok, bool with_value);
  void on_port_start(const VerilogToken& tok);
  void on_port_item(const VerilogToken& tok);
  void on_section(const VerilogToken& tok);
  void on_submodule_start(const VerilogToken& tok, bool with_params);
  void on_submodule_param_end(const VerilogToken& tok);
  void on_port_connection(const VerilogToken& tok);
  void on_end_submodule();
  void on_comment(const VerilogToken& tok, bool attachable);

  ModuleContext& module_for(Action action);
  SubModule& submodule_for(Action action);

  std::optional<ModuleContext> current_;
  std::vector<std::string> pending_desc_;   // comment lines seen outside any module

  // active composite type, set by the last port or parameter group
  PortMode mode_ = PortMode::Input;
  std::string data_type_ = kDefaultDataType;

  ItemKind last_kind_ = ItemKind::None;
  std::size_t last_index_ = 0;

  ModuleList modules_;
};

} // namespace hdldoc
