#ifndef CPP_AUTOMATON_HPP
#define CPP_AUTOMATON_HPP

#include <iostream>
#include <array>
#include <string>
#include <cstdint>
#include <random>
#include <regex>
#include <nlohmann/json.hpp>
#include "EvoErrors.hpp"

enum class Action : uint8_t { C = 0, D = 1 };

inline char ActionToChar(Action a) { return (a == Action::C) ? 'c' : 'd'; }

class State {
  public:
  State(Action act, size_t next_on_c, size_t next_on_d) : action(act), next{next_on_c, next_on_d} {
    if (next[0] > 1 || next[1] > 1) { throw InvalidConfiguration("state index must be 0 or 1"); }
  }
  Action Act() const { return action; }
  // state to move to when the opponent played `opponent`
  size_t Next(Action opponent) const { return next[static_cast<size_t>(opponent)]; }
  bool operator==(const State& rhs) const { return action == rhs.action && next == rhs.next; }
  private:
  Action action;
  std::array<size_t,2> next;
};

// two-state automaton. bit layout of the ID:
//   bit0    : current state
//   bit1..3 : state0 (action, next on c, next on d)
//   bit4..6 : state1 (action, next on c, next on d)
class Automaton {
  public:
  static constexpr uint64_t MaxID = 127ull;

  Automaton(const State& s0, const State& s1, size_t current_state) : states{s0, s1}, current(current_state) {
    if (current > 1) { throw InvalidConfiguration("current state index must be 0 or 1"); }
  }
  explicit Automaton(uint64_t id) : Automaton(StateFromBits(id >> 1u), StateFromBits(id >> 4u), id & 1ull) {
    if (id > MaxID) { throw InvalidConfiguration("automaton ID out of range: " + std::to_string(id)); }
  }

  static Automaton ALLD() { return Automaton(State(Action::D, 1, 1), State(Action::D, 1, 1), 1); }
  static Automaton ALLC() { return Automaton(State(Action::C, 0, 0), State(Action::C, 0, 0), 0); }
  static Automaton TFT() { return Automaton(State(Action::C, 0, 1), State(Action::D, 0, 1), 0); }
  static Automaton GRIM() { return Automaton(State(Action::C, 0, 1), State(Action::D, 1, 1), 0); }

  static Automaton ConstructFromName(const std::string& name) {
    if (name == "ALLD") return ALLD();
    else if (name == "ALLC") return ALLC();
    else if (name == "TFT") return TFT();
    else if (name == "GRIM") return GRIM();
    else if (std::regex_match(name, std::regex(R"(\d+)"))) {
      return Automaton(std::stoull(name));
    }
    throw InvalidConfiguration("unknown automaton name: " + name);
  }

  // uniform over the 128 automata, i.e. every field is an independent fair draw
  template <typename URBG>
  static Automaton Random(URBG& rnd) {
    std::uniform_int_distribution<uint64_t> sample(0ull, MaxID);
    return Automaton(sample(rnd));
  }

  Action CurrentAction() const { return states[current].Act(); }
  Automaton Step(Action opponent) const {
    return Automaton(states[0], states[1], states[current].Next(opponent));
  }
  size_t CurrentState() const { return current; }
  const State& StateAt(size_t i) const { return states.at(i); }

  uint64_t ID() const {
    return current | (StateBits(states[0]) << 1u) | (StateBits(states[1]) << 4u);
  }
  std::string Name() const {
    if (*this == ALLD()) return "ALLD";
    if (*this == ALLC()) return "ALLC";
    if (*this == TFT()) return "TFT";
    if (*this == GRIM()) return "GRIM";
    return std::to_string(ID());
  }
  // e.g. "c01-d01@0"
  std::string ToString() const {
    std::string s;
    for (size_t i = 0; i < 2; i++) {
      if (i > 0) s += '-';
      s += ActionToChar(states[i].Act());
      s += std::to_string(states[i].Next(Action::C));
      s += std::to_string(states[i].Next(Action::D));
    }
    return s + '@' + std::to_string(current);
  }

  bool operator==(const Automaton& rhs) const { return ID() == rhs.ID(); }
  bool operator!=(const Automaton& rhs) const { return !(*this == rhs); }

  friend std::ostream& operator<<(std::ostream& os, const Automaton& a) {
    os << a.Name() << '(' << a.ToString() << ')';
    return os;
  }
  friend void to_json(nlohmann::json& j, const Automaton& a) {
    j = nlohmann::json{{"id", a.ID()}, {"name", a.Name()}};
  }

  private:
  std::array<State,2> states;
  size_t current;

  static State StateFromBits(uint64_t bits) {
    return State(static_cast<Action>(bits & 1ull), (bits >> 1u) & 1ull, (bits >> 2u) & 1ull);
  }
  static uint64_t StateBits(const State& s) {
    return static_cast<uint64_t>(s.Act()) | (s.Next(Action::C) << 1u) | (s.Next(Action::D) << 2u);
  }
};

#endif //CPP_AUTOMATON_HPP
