#ifndef CPP_EVO_ERRORS_HPP
#define CPP_EVO_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <cstdint>

class InvalidConfiguration : public std::runtime_error {
  public:
  explicit InvalidConfiguration(const std::string& msg) : std::runtime_error("invalid configuration: " + msg) {}
};

// total payoff of the population is zero, so proportional selection is undefined
class DegenerateFitness : public std::runtime_error {
  public:
  DegenerateFitness() : std::runtime_error("degenerate fitness: total payoff is zero"), cycle(-1) {}
  explicit DegenerateFitness(int64_t t) :
    std::runtime_error("degenerate fitness: total payoff is zero at cycle " + std::to_string(t)), cycle(t) {}
  int64_t Cycle() const { return cycle; }  // -1 when raised outside of a cycle
  private:
  int64_t cycle;
};

#endif //CPP_EVO_ERRORS_HPP
