#pragma once
#include "hdldoc_lexer.hpp"
#include <tao/pegtl.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace hdldoc { namespace grammar {
using namespace tao::pegtl;

// ---------- numbered capture groups ----------

// group<N, R> matches exactly like R and records the matched text as group N.
template<std::size_t N, typename Rule>
struct group : Rule {};

struct Captures {
  std::vector<std::pair<std::size_t, std::string>> entries;
  std::vector<std::size_t> marks;
};

template<typename Rule>
struct capture_action : nothing<Rule> {};

template<std::size_t N, typename Rule>
struct capture_action<group<N, Rule>> {
  template<typename Input>
  static void apply(const Input& in, Captures& cap) { cap.entries.emplace_back(N, in.string()); }
};

// Groups recorded inside a rule that fails are dropped again, so a backtracked
// alternative never leaks a capture into the final match.
template<typename Rule>
struct capture_control : normal<Rule> {
  template<typename Input>
  static void start(const Input&, Captures& cap) { cap.marks.push_back(cap.entries.size()); }
  template<typename Input>
  static void success(const Input&, Captures& cap) { cap.marks.pop_back(); }
  template<typename Input>
  static void failure(const Input&, Captures& cap) {
    cap.entries.erase(cap.entries.begin() + static_cast<std::ptrdiff_t>(cap.marks.back()), cap.entries.end());
    cap.marks.pop_back();
  }
};

// Wraps a grammar rule as an anchored tokenizer pattern with Groups capture slots.
template<typename Rule, std::size_t Groups = 0>
lexer::Pattern pattern() {
  return [](std::string_view text, std::size_t pos) -> std::optional<lexer::Match> {
    const char* begin = text.data() + pos;
    memory_input<> in(begin, text.size() - pos, "hdldoc");
    Captures cap;
    if (!tao::pegtl::parse<Rule, capture_action, capture_control>(in, cap))
      return std::nullopt;
    lexer::Match m;
    m.length = static_cast<std::size_t>(in.current() - begin);
    m.groups.resize(Groups);
    for (auto& e : cap.entries)
      if (e.first < Groups) m.groups[e.first] = std::move(e.second);
    return m;
  };
}

// ---------- whitespace, comments, literals ----------

struct ws : plus< space > {};
struct sp : star< space > {};

struct line_text : star< not_one<'\n'> > {};
struct line_end  : opt< one<'\n'> > {};

struct block_comment_open  : string<'/','*'> {};
struct block_comment_close : string<'*','/'> {};
struct block_comment_body  : plus< not_at< block_comment_close >, any > {};
struct inline_comment      : seq< block_comment_open, until< block_comment_close > > {};
struct quiet_line_comment  : seq< string<'/','/'>, line_text, line_end > {};

// "//#{{label}}" marks the start of a port section
struct section_marker
  : seq< string<'/','/','#'>, star< blank >, string<'{','{'>,
         group< 0, star< not_at< string<'}','}'> >, not_one<'\n'> > >,
         string<'}','}'>, line_text, line_end > {};
// "//#" comments are documentation in every state
struct doc_comment  : seq< string<'/','/','#'>, star< one<'#'> >, group< 0, line_text >, line_end > {};
struct line_comment : seq< string<'/','/'>, star< one<'#'> >, group< 0, line_text >, line_end > {};

// (* attribute *), but not the "@(*)" or "@(* )" sensitivity list
struct attribute
  : seq< string<'(','*'>, not_at< star< space >, one<')'> >, until< string<'*',')'> > > {};

struct string_literal
  : seq< one<'"'>, star< sor< seq< one<'\\'>, any >, not_one<'"','\\','\n'> > >, one<'"'> > {};

// whitespace and comments allowed between the words of an instantiation
struct gap : star< sor< space, inline_comment, quiet_line_comment, attribute > > {};

// ---------- identifiers and keywords ----------

struct ident_first : ranges<'a','z','A','Z','_'> {};
struct ident_other : sor< alnum, one<'_','$'> > {};
struct ident_norm  : seq< ident_first, star< ident_other > > {};
struct ident_esc   : seq< one<'\\'>, plus< not_one<' ','\t','\r','\n'> > > {};
struct ident       : sor< ident_esc, ident_norm > {};

struct kw_module    : TAO_PEGTL_KEYWORD("module") {};
struct kw_endmodule : TAO_PEGTL_KEYWORD("endmodule") {};
struct kw_parameter : TAO_PEGTL_KEYWORD("parameter") {};
struct kw_signed    : TAO_PEGTL_KEYWORD("signed") {};

struct direction : sor< TAO_PEGTL_KEYWORD("input"), TAO_PEGTL_KEYWORD("output"), TAO_PEGTL_KEYWORD("inout") > {};

struct net_type
  : sor< TAO_PEGTL_KEYWORD("reg"), TAO_PEGTL_KEYWORD("wire"), TAO_PEGTL_KEYWORD("logic"),
         TAO_PEGTL_KEYWORD("supply0"), TAO_PEGTL_KEYWORD("supply1"),
         TAO_PEGTL_KEYWORD("tri"), TAO_PEGTL_KEYWORD("triand"), TAO_PEGTL_KEYWORD("trior"),
         TAO_PEGTL_KEYWORD("tri0"), TAO_PEGTL_KEYWORD("tri1"),
         TAO_PEGTL_KEYWORD("wand"), TAO_PEGTL_KEYWORD("wor") > {};

struct param_type
  : sor< TAO_PEGTL_KEYWORD("signed"), TAO_PEGTL_KEYWORD("integer"),
         TAO_PEGTL_KEYWORD("realtime"), TAO_PEGTL_KEYWORD("real"), TAO_PEGTL_KEYWORD("time"),
         TAO_PEGTL_KEYWORD("logic"), TAO_PEGTL_KEYWORD("reg"), TAO_PEGTL_KEYWORD("bit"),
         TAO_PEGTL_KEYWORD("int") > {};

// built-in gate and switch primitives; their instances may omit the name
struct gate_type
  : sor< sor< TAO_PEGTL_KEYWORD("and"), TAO_PEGTL_KEYWORD("nand"), TAO_PEGTL_KEYWORD("or"),
              TAO_PEGTL_KEYWORD("nor"), TAO_PEGTL_KEYWORD("xor"), TAO_PEGTL_KEYWORD("xnor"),
              TAO_PEGTL_KEYWORD("buf"), TAO_PEGTL_KEYWORD("not"),
              TAO_PEGTL_KEYWORD("bufif0"), TAO_PEGTL_KEYWORD("bufif1"),
              TAO_PEGTL_KEYWORD("notif0"), TAO_PEGTL_KEYWORD("notif1"),
              TAO_PEGTL_KEYWORD("pullup"), TAO_PEGTL_KEYWORD("pulldown") >,
         sor< TAO_PEGTL_KEYWORD("nmos"), TAO_PEGTL_KEYWORD("pmos"), TAO_PEGTL_KEYWORD("cmos"),
              TAO_PEGTL_KEYWORD("rnmos"), TAO_PEGTL_KEYWORD("rpmos"), TAO_PEGTL_KEYWORD("rcmos"),
              TAO_PEGTL_KEYWORD("tran"), TAO_PEGTL_KEYWORD("tranif0"), TAO_PEGTL_KEYWORD("tranif1"),
              TAO_PEGTL_KEYWORD("rtran"), TAO_PEGTL_KEYWORD("rtranif0"),
              TAO_PEGTL_KEYWORD("rtranif1") > > {};

// Words that never name a module type or an instance.
struct reserved
  : sor< sor< TAO_PEGTL_KEYWORD("always"), TAO_PEGTL_KEYWORD("always_comb"),
              TAO_PEGTL_KEYWORD("always_ff"), TAO_PEGTL_KEYWORD("always_latch"),
              TAO_PEGTL_KEYWORD("assign"), TAO_PEGTL_KEYWORD("automatic"),
              TAO_PEGTL_KEYWORD("begin"), TAO_PEGTL_KEYWORD("end"),
              TAO_PEGTL_KEYWORD("case"), TAO_PEGTL_KEYWORD("casex"), TAO_PEGTL_KEYWORD("casez"),
              TAO_PEGTL_KEYWORD("endcase"), TAO_PEGTL_KEYWORD("default"),
              TAO_PEGTL_KEYWORD("defparam"), TAO_PEGTL_KEYWORD("disable") >,
         sor< TAO_PEGTL_KEYWORD("if"), TAO_PEGTL_KEYWORD("else"),
              TAO_PEGTL_KEYWORD("for"), TAO_PEGTL_KEYWORD("forever"),
              TAO_PEGTL_KEYWORD("while"), TAO_PEGTL_KEYWORD("repeat"),
              TAO_PEGTL_KEYWORD("wait"), TAO_PEGTL_KEYWORD("return"),
              TAO_PEGTL_KEYWORD("function"), TAO_PEGTL_KEYWORD("endfunction"),
              TAO_PEGTL_KEYWORD("task"), TAO_PEGTL_KEYWORD("endtask"),
              TAO_PEGTL_KEYWORD("generate"), TAO_PEGTL_KEYWORD("endgenerate"),
              TAO_PEGTL_KEYWORD("genvar") >,
         sor< TAO_PEGTL_KEYWORD("initial"), TAO_PEGTL_KEYWORD("module"),
              TAO_PEGTL_KEYWORD("endmodule"), TAO_PEGTL_KEYWORD("input"),
              TAO_PEGTL_KEYWORD("output"), TAO_PEGTL_KEYWORD("inout"),
              TAO_PEGTL_KEYWORD("parameter"), TAO_PEGTL_KEYWORD("localparam"),
              TAO_PEGTL_KEYWORD("posedge"), TAO_PEGTL_KEYWORD("negedge"),
              TAO_PEGTL_KEYWORD("integer"), TAO_PEGTL_KEYWORD("real"),
              TAO_PEGTL_KEYWORD("time"), TAO_PEGTL_KEYWORD("signed"),
              TAO_PEGTL_KEYWORD("unsigned") >,
         net_type,
         gate_type > {};

// SystemVerilog words that are plain identifiers in Verilog-2001; they only
// keep a statement from being read as an instantiation.
struct sv_reserved
  : sor< TAO_PEGTL_KEYWORD("bit"), TAO_PEGTL_KEYWORD("int"), TAO_PEGTL_KEYWORD("byte"),
         TAO_PEGTL_KEYWORD("typedef"), TAO_PEGTL_KEYWORD("assert"),
         TAO_PEGTL_KEYWORD("unique"), TAO_PEGTL_KEYWORD("priority") > {};

struct instance_ident : seq< not_at< reserved >, not_at< sv_reserved >, ident > {};

// a whole word at a time, so keywords are never matched inside identifiers
struct skip_any : sor< ident, any > {};

// ---------- balanced text ----------

struct paren_group;
struct bracket_group;
struct brace_group;
struct balanced : sor< paren_group, bracket_group, brace_group > {};
struct paren_group   : seq< one<'('>, star< sor< balanced, not_one<'(',')','[',']','{','}'> > >, one<')'> > {};
struct bracket_group : seq< one<'['>, star< sor< balanced, not_one<'(',')','[',']','{','}'> > >, one<']'> > {};
struct brace_group   : seq< one<'{'>, star< sor< balanced, not_one<'(',')','[',']','{','}'> > >, one<'}'> > {};

// an expression up to the next top-level ',' ';' or ')'
struct value_char
  : seq< not_at< string<'/','/'> >, not_at< block_comment_open >,
         not_one<',',';','(',')','[',']','{','}'> > {};
struct value_core : sor< balanced, string_literal, value_char > {};
// comments inside an expression; a comment after its last atom is left alone
struct value_comment
  : seq< plus< sor< inline_comment, quiet_line_comment, space > >, at< value_core > > {};
struct value_atom : sor< value_core, value_comment > {};
struct value : plus< value_atom > {};

// ---------- module ----------

struct module_start : seq< kw_module, gap, group< 0, ident >, sp > {};

struct function_block : seq< TAO_PEGTL_KEYWORD("function"), until< TAO_PEGTL_KEYWORD("endfunction") > > {};
struct task_block     : seq< TAO_PEGTL_KEYWORD("task"), until< TAO_PEGTL_KEYWORD("endtask") > > {};

// ---------- parameters ----------

struct parameter_start
  : seq< kw_parameter, sp,
         opt< group< 0, param_type >, sp, not_at< one<'=',',',';',')'> > >,
         opt< group< 1, bracket_group >, sp > > {};
struct param_item_with_value : seq< group< 0, ident >, sp, one<'='>, sp, group< 1, value > > {};
struct param_item            : seq< not_at< reserved >, group< 0, ident >, sp, opt< one<','> > > {};

// ---------- ports ----------

struct port_start
  : seq< group< 0, direction >, sp,
         opt< group< 1, net_type >, sp >,
         opt< group< 2, kw_signed >, sp >,
         opt< group< 3, bracket_group > > > {};
struct port_default : seq< one<'='>, sp, value > {};
struct port_item    : seq< not_at< reserved >, group< 0, ident >, sp, star< bracket_group, sp >, opt< one<','> > > {};

struct list_close : one<')',';'> {};
// "input clk; // text": the comment on the line of the closing ';' belongs to the declaration
struct decl_close_comment : seq< one<';'>, star< blank >, not_at< section_marker >, line_comment > {};

// ---------- submodule instances ----------

struct submodule_param_start : seq< group< 0, instance_ident >, gap, one<'#'>, gap, one<'('> > {};
struct submodule_start       : seq< group< 0, instance_ident >, gap, group< 1, instance_ident >, gap, one<'('> > {};
struct submodule_param_end   : seq< one<')'>, gap, group< 0, ident >, gap, one<'('> > {};
struct submodule_end         : seq< one<')'>, gap, one<';'> > {};
struct port_connection
  : seq< one<'.'>, gap, group< 0, ident >, gap, one<'('>,
         group< 1, star< sor< paren_group, not_one<'(',')'> > > >, one<')'> > {};

}} // namespace hdldoc::grammar
