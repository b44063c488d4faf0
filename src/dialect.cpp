#include "hdldoc_dialect.hpp"
#include "hdldoc_grammar.hpp"

namespace hdldoc {

namespace {

using namespace hdldoc::grammar;
using VerilogRule = lexer::Rule<LexState, Action>;
using lexer::Pattern;

VerilogRule silent(Pattern p, lexer::Transition<LexState> next = lexer::stay<LexState>()) {
  return VerilogRule{ std::move(p), std::nullopt, next };
}
VerilogRule emit(Pattern p, Action a, lexer::Transition<LexState> next = lexer::stay<LexState>()) {
  return VerilogRule{ std::move(p), a, next };
}

VerilogConfig make_verilog_rules() {
  const auto pop = lexer::pop<LexState>();
  const auto to_comment = lexer::push(LexState::BlockComment);

  VerilogConfig cfg;
  cfg.root = LexState::Root;

  cfg.states[LexState::Root] = {
    silent(pattern<ws>()),
    emit(pattern<block_comment_open>(), Action::BlockComment, to_comment),
    emit(pattern<line_comment, 1>(), Action::Metacomment),
    silent(pattern<string_literal>()),
    emit(pattern<module_start, 1>(), Action::ModuleStart, lexer::push(LexState::Module)),
    silent(pattern<skip_any>()),
  };

  cfg.states[LexState::Module] = {
    silent(pattern<ws>()),
    emit(pattern<block_comment_open>(), Action::BlockComment, to_comment),
    emit(pattern<section_marker, 1>(), Action::SectionMeta),
    emit(pattern<doc_comment, 1>(), Action::Metacomment),
    emit(pattern<line_comment, 1>(), Action::Comment),
    silent(pattern<string_literal>()),
    silent(pattern<attribute>()),
    // endmodule must win over the instantiation rules below
    emit(pattern<kw_endmodule>(), Action::EndModule, pop),
    silent(pattern<function_block>()),
    silent(pattern<task_block>()),
    emit(pattern<parameter_start, 2>(), Action::ParameterStart, lexer::push(LexState::Parameters)),
    emit(pattern<port_start, 4>(), Action::PortStart, lexer::push(LexState::ModulePort)),
    emit(pattern<submodule_param_start, 1>(), Action::SubmoduleParamStart, lexer::push(LexState::SubmoduleParams)),
    emit(pattern<submodule_start, 2>(), Action::SubmoduleStart, lexer::push(LexState::Submodule)),
    silent(pattern<skip_any>()),
  };

  cfg.states[LexState::Parameters] = {
    silent(pattern<ws>()),
    emit(pattern<block_comment_open>(), Action::BlockComment, to_comment),
    emit(pattern<section_marker, 1>(), Action::SectionMeta),
    emit(pattern<line_comment, 1>(), Action::Metacomment),
    silent(pattern<attribute>()),
    emit(pattern<parameter_start, 2>(), Action::ParameterStart),
    emit(pattern<param_item_with_value, 2>(), Action::ParamItemWithValue),
    emit(pattern<param_item, 1>(), Action::ParamItem),
    silent(pattern<one<','>>()),
    emit(pattern<decl_close_comment, 1>(), Action::Metacomment, pop),
    silent(pattern<list_close>(), pop),
    silent(pattern<skip_any>()),
  };

  cfg.states[LexState::ModulePort] = {
    silent(pattern<ws>()),
    emit(pattern<block_comment_open>(), Action::BlockComment, to_comment),
    emit(pattern<section_marker, 1>(), Action::SectionMeta),
    emit(pattern<line_comment, 1>(), Action::Metacomment),
    silent(pattern<attribute>()),
    emit(pattern<port_start, 4>(), Action::PortStart),
    silent(pattern<port_default>()),
    emit(pattern<port_item, 1>(), Action::PortItem),
    silent(pattern<one<','>>()),
    emit(pattern<decl_close_comment, 1>(), Action::Metacomment, pop),
    silent(pattern<list_close>(), pop),
    silent(pattern<skip_any>()),
  };

  cfg.states[LexState::SubmoduleParams] = {
    silent(pattern<ws>()),
    emit(pattern<block_comment_open>(), Action::BlockComment, to_comment),
    silent(pattern<quiet_line_comment>()),
    silent(pattern<string_literal>()),
    emit(pattern<submodule_param_end, 1>(), Action::SubmoduleParamEnd),
    emit(pattern<submodule_end>(), Action::EndSubmodule, pop),
    emit(pattern<port_connection, 2>(), Action::PortConnection),
    silent(pattern<skip_any>()),
  };

  cfg.states[LexState::Submodule] = {
    silent(pattern<ws>()),
    emit(pattern<block_comment_open>(), Action::BlockComment, to_comment),
    silent(pattern<quiet_line_comment>()),
    silent(pattern<string_literal>()),
    emit(pattern<submodule_end>(), Action::EndSubmodule, pop),
    emit(pattern<port_connection, 2>(), Action::PortConnection),
    silent(pattern<skip_any>()),
  };

  cfg.states[LexState::BlockComment] = {
    emit(pattern<block_comment_close>(), Action::EndComment, pop),
    silent(pattern<block_comment_body>()),
  };

  return cfg;
}

} // namespace

const VerilogConfig& verilog_rules() {
  static const VerilogConfig rules = make_verilog_rules();
  return rules;
}

const char* to_string(LexState state) {
  switch (state) {
    case LexState::Root:            return "root";
    case LexState::Module:          return "module";
    case LexState::Parameters:      return "parameters";
    case LexState::ModulePort:      return "module_port";
    case LexState::SubmoduleParams: return "submodule_params";
    case LexState::Submodule:       return "submodule";
    case LexState::BlockComment:    return "block_comment";
  }
  return "unknown";
}

const char* to_string(Action action) {
  switch (action) {
    case Action::BlockComment:        return "block_comment";
    case Action::EndComment:          return "end_comment";
    case Action::Metacomment:         return "metacomment";
    case Action::Comment:             return "comment";
    case Action::SectionMeta:         return "section_meta";
    case Action::ModuleStart:         return "module";
    case Action::EndModule:           return "end_module";
    case Action::ParameterStart:      return "parameter_start";
    case Action::ParamItemWithValue:  return "param_item_with_value";
    case Action::ParamItem:           return "param_item";
    case Action::PortStart:           return "module_port_start";
    case Action::PortItem:            return "port_param";
    case Action::SubmoduleParamStart: return "submodule_param_start";
    case Action::SubmoduleParamEnd:   return "submodule_param_end";
    case Action::SubmoduleStart:      return "submodule_start";
    case Action::PortConnection:      return "port_connection";
    case Action::EndSubmodule:        return "end_submodule";
  }
  return "unknown";
}

} // namespace hdldoc
