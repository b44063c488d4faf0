#include "hdldoc_builder.hpp"
#include <algorithm>

namespace hdldoc {

namespace {

std::string trim(const std::string& s) {
  auto a = s.find_first_not_of(" \t\r\n");
  auto b = s.find_last_not_of(" \t\r\n");
  return (a == std::string::npos) ? std::string() : s.substr(a, b - a + 1);
}

// Removes "//" and "/* */" comments outside string literals. When any were
// removed, runs of whitespace collapse to one space.
std::string strip_comments(const std::string& s) {
  std::string out;
  bool removed = false;
  for (std::size_t i = 0; i < s.size();) {
    if (s[i] == '"') {
      std::size_t end = i + 1;
      while (end < s.size() && s[end] != '"') end += (s[end] == '\\') ? 2 : 1;
      end = std::min(end + 1, s.size());
      out.append(s, i, end - i);
      i = end;
    } else if (s.compare(i, 2, "//") == 0) {
      auto nl = s.find('\n', i);
      i = (nl == std::string::npos) ? s.size() : nl;
      removed = true;
    } else if (s.compare(i, 2, "/*") == 0) {
      auto close = s.find("*/", i + 2);
      i = (close == std::string::npos) ? s.size() : close + 2;
      out += ' ';
      removed = true;
    } else {
      out += s[i++];
    }
  }
  if (!removed) return out;

  std::string collapsed;
  bool in_string = false;
  for (std::size_t i = 0; i < out.size(); ++i) {
    char c = out[i];
    if (c == '"' && (i == 0 || out[i - 1] != '\\')) in_string = !in_string;
    bool blank = !in_string && (c == ' ' || c == '\t' || c == '\r' || c == '\n');
    if (!blank) collapsed += c;
    else if (!collapsed.empty() && collapsed.back() != ' ') collapsed += ' ';
  }
  return collapsed;
}

inline std::string strip_backslash(std::string s) {
  if (!s.empty() && s[0] == '\\') return s.substr(1);
  return s;
}

const std::optional<std::string>& group_at(const VerilogToken& tok, std::size_t i) {
  static const std::optional<std::string> absent;
  return i < tok.groups.size() ? tok.groups[i] : absent;
}

std::string name_at(const VerilogToken& tok, std::size_t i) {
  const auto& g = group_at(tok, i);
  if (!g || g->empty())
    throw builder_error(std::string(to_string(tok.action)) + " token at offset "
                        + std::to_string(tok.offset) + " carries no name");
  return strip_backslash(trim(*g));
}

PortMode mode_from(const std::string& s) {
  if (s == "output") return PortMode::Output;
  if (s == "inout")  return PortMode::Inout;
  return PortMode::Input;
}

} // namespace

void EntityBuilder::apply(const VerilogToken& tok) {
  switch (tok.action) {
    case Action::ModuleStart:         on_module_start(tok); break;
    case Action::EndModule:           on_end_module(); break;
    case Action::ParameterStart:      on_parameter_start(tok); break;
    case Action::ParamItemWithValue:  on_param_item(tok, true); break;
    case Action::ParamItem:           on_param_item(tok, false); break;
    case Action::PortStart:           on_port_start(tok); break;
    case Action::PortItem:            on_port_item(tok); break;
    case Action::SectionMeta:         on_section(tok); break;
    case Action::SubmoduleParamStart: on_submodule_start(tok, true); break;
    case Action::SubmoduleStart:      on_submodule_start(tok, false); break;
    case Action::SubmoduleParamEnd:   on_submodule_param_end(tok); break;
    case Action::PortConnection:      on_port_connection(tok); break;
    case Action::EndSubmodule:        on_end_submodule(); break;
    case Action::Metacomment:         on_comment(tok, true); break;
    case Action::Comment:             on_comment(tok, false); break;
    case Action::BlockComment:
    case Action::EndComment:
      break;
  }
}

ModuleList EntityBuilder::finish() {
  if (current_)
    throw structural_error("module '" + current_->name + "' is never closed");
  return std::move(modules_);
}

EntityBuilder::ModuleContext& EntityBuilder::module_for(Action action) {
  if (!current_)
    throw builder_error(std::string(to_string(action)) + " outside of a module");
  return *current_;
}

SubModule& EntityBuilder::submodule_for(Action action) {
  auto& ctx = module_for(action);
  if (!ctx.pending_submodule)
    throw builder_error(std::string(to_string(action)) + " without a submodule in progress in module '"
                        + ctx.name + "'");
  return *ctx.pending_submodule;
}

// ---------- modules ----------

void EntityBuilder::on_module_start(const VerilogToken& tok) {
  if (current_)
    throw builder_error("module '" + name_at(tok, 0) + "' opened inside module '" + current_->name + "'");
  current_ = ModuleContext{};
  current_->name = name_at(tok, 0);
  current_->desc_lines = std::move(pending_desc_);
  pending_desc_.clear();
  mode_ = PortMode::Input;
  data_type_ = kDefaultDataType;
  last_kind_ = ItemKind::None;
}

void EntityBuilder::on_end_module() {
  auto& ctx = module_for(Action::EndModule);
  if (ctx.pending_submodule)
    throw builder_error("module '" + ctx.name + "' closed inside instantiation of '"
                        + ctx.pending_submodule->module_type + "'");

  Module m;
  m.name = std::move(ctx.name);

  // a label at index i claims ports [i, next break-point); break-points past the last port are dropped
  std::vector<std::pair<std::size_t, std::string>> kept;
  for (auto& bp : ctx.breakpoints)
    if (bp.first < ctx.ports.size()) kept.push_back(std::move(bp));
  for (std::size_t k = 0; k < kept.size(); ++k) {
    std::size_t end = (k + 1 < kept.size()) ? kept[k + 1].first : ctx.ports.size();
    auto& slice = m.sections[kept[k].second];
    for (std::size_t i = kept[k].first; i < end; ++i) slice.push_back(ctx.ports[i].name);
  }

  m.ports = std::move(ctx.ports);
  m.generics = std::move(ctx.generics);
  m.submodules = std::move(ctx.submodules);
  if (!ctx.desc_lines.empty()) {
    std::string desc;
    for (std::size_t i = 0; i < ctx.desc_lines.size(); ++i) {
      if (i) desc += '\n';
      desc += ctx.desc_lines[i];
    }
    m.desc = std::move(desc);
  }
  modules_.emplace_back(std::move(m));

  current_.reset();
  pending_desc_.clear();
  last_kind_ = ItemKind::None;
}

// ---------- parameters ----------

void EntityBuilder::on_parameter_start(const VerilogToken& tok) {
  module_for(tok.action);
  const auto& type = group_at(tok, 0);
  const auto& range = group_at(tok, 1);
  data_type_ = type ? trim(*type) : kDefaultDataType;
  if (range) data_type_ += ' ' + trim(*range);
}

void EntityBuilder::on_param_item(const VerilogToken& tok, bool with_value) {
  auto& ctx = module_for(tok.action);
  Parameter p;
  p.name = name_at(tok, 0);
  p.data_type = data_type_;
  if (with_value) {
    const auto& value = group_at(tok, 1);
    if (value) p.default_value = trim(strip_comments(*value));
  } else {
    for (const auto& existing : ctx.generics)
      if (existing.name == p.name) return;   // first declaration wins
  }
  ctx.generics.push_back(std::move(p));
  last_kind_ = ItemKind::Parameter;
  last_index_ = ctx.generics.size() - 1;
}

// ---------- ports ----------

void EntityBuilder::on_port_start(const VerilogToken& tok) {
  module_for(tok.action);
  const auto& dir    = group_at(tok, 0);
  const auto& net    = group_at(tok, 1);
  const auto& sign   = group_at(tok, 2);
  const auto& range  = group_at(tok, 3);
  mode_ = dir ? mode_from(trim(*dir)) : PortMode::Input;
  data_type_ = net ? trim(*net) : kDefaultDataType;
  if (sign)  data_type_ += ' ' + trim(*sign);
  if (range) data_type_ += ' ' + trim(*range);
}

void EntityBuilder::on_port_item(const VerilogToken& tok) {
  auto& ctx = module_for(tok.action);
  std::string name = name_at(tok, 0);
  auto it = ctx.port_index.find(name);
  std::size_t index;
  if (it == ctx.port_index.end()) {
    index = ctx.ports.size();
    ctx.port_index.emplace(name, index);
    ctx.ports.push_back(Port{ name, mode_, data_type_, std::nullopt });
  } else {
    // redeclaration keeps the original position
    index = it->second;
    ctx.ports[index].mode = mode_;
    ctx.ports[index].data_type = data_type_;
  }
  last_kind_ = ItemKind::Port;
  last_index_ = index;
}

void EntityBuilder::on_section(const VerilogToken& tok) {
  auto& ctx = module_for(tok.action);
  const auto& label = group_at(tok, 0);
  ctx.breakpoints.emplace_back(ctx.ports.size(), label ? trim(*label) : std::string());
}

// ---------- submodules ----------

void EntityBuilder::on_submodule_start(const VerilogToken& tok, bool with_params) {
  auto& ctx = module_for(tok.action);
  if (ctx.pending_submodule)
    throw builder_error("instantiation of '" + name_at(tok, 0) + "' starts inside instantiation of '"
                        + ctx.pending_submodule->module_type + "'");
  SubModule sub;
  sub.module_type = name_at(tok, 0);
  if (!with_params) sub.instance_name = name_at(tok, 1);
  ctx.pending_submodule = std::move(sub);
}

void EntityBuilder::on_submodule_param_end(const VerilogToken& tok) {
  submodule_for(tok.action).instance_name = name_at(tok, 0);
}

void EntityBuilder::on_port_connection(const VerilogToken& tok) {
  auto& sub = submodule_for(tok.action);
  const auto& actual = group_at(tok, 1);
  sub.port_connections[name_at(tok, 0)] = actual ? trim(*actual) : std::string();
}

void EntityBuilder::on_end_submodule() {
  auto& ctx = module_for(Action::EndSubmodule);
  auto& sub = submodule_for(Action::EndSubmodule);
  if (sub.instance_name.empty())
    throw builder_error("instantiation of '" + sub.module_type + "' in module '" + ctx.name
                        + "' has no instance name");
  ctx.submodules.push_back(std::move(sub));
  ctx.pending_submodule.reset();
}

// ---------- comments ----------

// A comment describes the module until its first port or parameter; after that
// only metacomments attach, and they describe the most recent item.
void EntityBuilder::on_comment(const VerilogToken& tok, bool attachable) {
  const auto& g = group_at(tok, 0);
  std::string text = g ? trim(*g) : std::string();
  if (text.empty()) return;

  if (last_kind_ == ItemKind::None) {
    if (current_) current_->desc_lines.push_back(std::move(text));
    else pending_desc_.push_back(std::move(text));
    return;
  }
  if (!attachable || !current_) return;
  if (last_kind_ == ItemKind::Port) current_->ports[last_index_].desc = std::move(text);
  else current_->generics[last_index_].desc = std::move(text);
}

} // namespace hdldoc
