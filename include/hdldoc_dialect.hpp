#pragma once
#include "hdldoc_lexer.hpp"

namespace hdldoc {

enum class LexState { Root, Module, Parameters, ModulePort, SubmoduleParams, Submodule, BlockComment };

enum class Action {
  BlockComment, EndComment,
  Metacomment,          // group 0: comment text
  Comment,              // group 0: comment text of a plain "//" comment in a module body
  SectionMeta,          // group 0: section label
  ModuleStart,          // group 0: module name
  EndModule,
  ParameterStart,       // group 0: type keyword, group 1: range
  ParamItemWithValue,   // group 0: name, group 1: default value
  ParamItem,            // group 0: name
  PortStart,            // group 0: direction, 1: net type, 2: signedness, 3: range
  PortItem,             // group 0: name
  SubmoduleParamStart,  // group 0: module type
  SubmoduleParamEnd,    // group 0: instance name
  SubmoduleStart,       // group 0: module type, group 1: instance name
  PortConnection,       // group 0: formal name, group 1: actual expression
  EndSubmodule
};

using VerilogConfig = lexer::Config<LexState, Action>;
using VerilogLexer  = lexer::Lexer<LexState, Action>;
using VerilogToken  = lexer::Token<Action>;

// Rule table for Verilog-2001 style sources.
const VerilogConfig& verilog_rules();

const char* to_string(LexState state);
const char* to_string(Action action);

} // namespace hdldoc
