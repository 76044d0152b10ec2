#ifndef CPP_FITNESS_SELECTOR_HPP
#define CPP_FITNESS_SELECTOR_HPP

#include <vector>
#include <random>
#include <algorithm>
#include <cmath>
#include "Automaton.hpp"
#include "EvoErrors.hpp"

class FitnessSelector {
  public:
  // cumulative distribution of size N+1: d[0] = 0, d[i] = d[i-1] + p[i-1]/sum(p), d[N] = 1
  static std::vector<double> ComputeDistribution(const std::vector<double>& payoffs) {
    if (payoffs.empty()) { throw InvalidConfiguration("empty payoff vector"); }
    double s = 0.0;
    for (double p: payoffs) {
      if (p < 0.0) { throw InvalidConfiguration("negative payoff: " + std::to_string(p)); }
      s += p;
    }
    if (s == 0.0) { throw DegenerateFitness(); }

    std::vector<double> cumulative(payoffs.size() + 1, 0.0);
    for (size_t i = 1; i <= payoffs.size(); i++) {
      cumulative[i] = cumulative[i-1] + payoffs[i-1] / s;
    }
    constexpr double tolerance = 1.0e-8;
    if (std::abs(cumulative.back() - 1.0) > tolerance) {
      throw std::runtime_error("cannot happen: cumulative distribution does not sum up to one");
    }
    cumulative.back() = 1.0;
    return cumulative;
  }

  // index i of the smallest d[i] > r01, shifted to the population slot i-1
  static size_t SampleIndex(const std::vector<double>& distribution, double r01) {
    auto it = std::upper_bound(distribution.begin(), distribution.end(), r01);
    if (it == distribution.begin() || it == distribution.end()) {
      throw std::runtime_error("cannot happen: r01 is out of the distribution");
    }
    return static_cast<size_t>(it - distribution.begin()) - 1;
  }

  // `count` independent draws with replacement
  template <typename URBG>
  static std::vector<Automaton> Sample(const std::vector<double>& distribution,
                                       const std::vector<Automaton>& population, size_t count, URBG& rnd) {
    if (distribution.size() != population.size() + 1) {
      throw InvalidConfiguration("distribution size must be population size + 1");
    }
    std::uniform_real_distribution<double> uni(0.0, 1.0);
    std::vector<Automaton> ans;
    ans.reserve(count);
    for (size_t n = 0; n < count; n++) {
      double r = uni(rnd);
      if (r >= 1.0) { r = std::nextafter(1.0, 0.0); }  // generate_canonical may round up to 1
      ans.push_back(population[SampleIndex(distribution, r)]);
    }
    return ans;
  }
};

#endif //CPP_FITNESS_SELECTOR_HPP
