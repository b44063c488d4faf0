#pragma once
#include "hdldoc.hpp"
#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace hdldoc { namespace lexer {

// ---------- rule table ----------

enum class Step { Stay, Push, Pop };

template<typename State>
struct Transition {
  Step step = Step::Stay;
  State target{};
};

template<typename State> Transition<State> stay() { return Transition<State>{}; }
template<typename State> Transition<State> push(State s) { return Transition<State>{ Step::Push, s }; }
template<typename State> Transition<State> pop() { return Transition<State>{ Step::Pop, State{} }; }

struct Match {
  std::size_t length = 0;
  std::vector<std::optional<std::string>> groups;
};

// A pattern is anchored: it either matches text starting exactly at pos or not at all.
using Pattern = std::function<std::optional<Match>(std::string_view text, std::size_t pos)>;

template<typename State, typename Action>
struct Rule {
  Pattern pattern;
  std::optional<Action> action;   // nullopt: silent rule
  Transition<State> next;
};

template<typename State, typename Action>
struct Config {
  State root{};
  std::map<State, std::vector<Rule<State, Action>>> states;
};

template<typename Action>
struct Token {
  std::size_t offset = 0;
  Action action{};
  std::vector<std::optional<std::string>> groups;
};

// ---------- engine ----------

// Scans text with the rules of the state on top of a state stack. The first
// rule of the current state that matches wins. Tokens are produced lazily by
// next(); the scan is single pass and cannot be rewound. The lexer keeps
// references to the config and to the text, both must outlive it.
template<typename State, typename Action>
class Lexer {
public:
  Lexer(const Config<State, Action>& config, std::string_view text)
    : config_(config), text_(text) {
    validate();
    stack_.push_back(config_.root);
  }
  Lexer(Config<State, Action>&&, std::string_view) = delete;

  // Returns the next emitted token, or nullopt once the whole text is scanned.
  // Throws lexical_error when no rule of the current state matches.
  std::optional<Token<Action>> next() {
    while (pos_ < text_.size()) {
      const auto& rules = config_.states.at(stack_.back());
      const Rule<State, Action>* hit = nullptr;
      Match m;
      for (const auto& rule : rules) {
        auto res = rule.pattern(text_, pos_);
        // an empty match would never advance the cursor
        if (res && res->length > 0) { hit = &rule; m = std::move(*res); break; }
      }
      if (!hit)
        throw lexical_error("no rule matches at offset " + std::to_string(pos_), pos_);

      const std::size_t start = pos_;
      pos_ += m.length;
      apply(hit->next, start);
      if (hit->action)
        return Token<Action>{ start, *hit->action, std::move(m.groups) };
    }
    return std::nullopt;
  }

  std::size_t depth() const { return stack_.size(); }
  State state() const { return stack_.back(); }
  std::size_t offset() const { return pos_; }

private:
  void validate() const {
    if (!config_.states.count(config_.root))
      throw std::invalid_argument("lexer config has no rules for its root state");
    for (const auto& entry : config_.states)
      for (const auto& rule : entry.second) {
        if (!rule.pattern)
          throw std::invalid_argument("lexer config holds a rule without a pattern");
        if (rule.next.step == Step::Push && !config_.states.count(rule.next.target))
          throw std::invalid_argument("lexer config pushes a state that has no rules");
      }
  }

  void apply(const Transition<State>& t, std::size_t at) {
    switch (t.step) {
      case Step::Stay: break;
      case Step::Push: stack_.push_back(t.target); break;
      case Step::Pop:
        if (stack_.size() == 1)
          throw structural_error("pop of the root state at offset " + std::to_string(at));
        stack_.pop_back();
        break;
    }
  }

  const Config<State, Action>& config_;
  std::string_view text_;
  std::size_t pos_ = 0;
  std::vector<State> stack_;
};

}} // namespace hdldoc::lexer
