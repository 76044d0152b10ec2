#ifndef CPP_EVO_GAME_HPP
#define CPP_EVO_GAME_HPP

#include <iostream>
#include <vector>
#include <array>
#include <map>
#include <random>
#include <algorithm>
#include <cmath>
#include <utility>
#include <nlohmann/json.hpp>
#include "icecream-cpp/icecream.hpp"
#include "Automaton.hpp"
#include "RepeatedGame.hpp"
#include "FitnessSelector.hpp"
#include "EvoErrors.hpp"


template <typename URBG>
std::vector<Automaton> GeneratePopulation(int64_t n, URBG& rnd) {
  if (n < 2 || n % 2 != 0) {
    throw InvalidConfiguration("population size must be even and >= 2: " + std::to_string(n));
  }
  std::vector<Automaton> population;
  population.reserve(n);
  for (int64_t i = 0; i < n; i++) {
    population.emplace_back(Automaton::Random(rnd));
  }
  return population;
}

inline void ValidateEvolution(size_t N, int64_t cycles, int64_t speed, int64_t rounds) {
  if (N < 2 || N % 2 != 0) {
    throw InvalidConfiguration("population size must be even and >= 2: " + std::to_string(N));
  }
  if (speed <= 0 || speed >= static_cast<int64_t>(N)) {
    throw InvalidConfiguration("speed must be in (0, population size): " + std::to_string(speed));
  }
  if (rounds < 1) { throw InvalidConfiguration("rounds must be positive: " + std::to_string(rounds)); }
  if (cycles < 0) { throw InvalidConfiguration("cycles must be non-negative: " + std::to_string(cycles)); }
}

// one cycle: the first `speed` slots die and are replaced by individuals resampled
// in proportion to payoff. Since the population is shuffled at the end of every cycle,
// this is a random death process with fitness-weighted rebirth.
// returns the mean payoff per round of the cycle.
template <typename URBG>
double EvolutionCycle(std::vector<Automaton>& population, int64_t speed, int64_t rounds, int64_t t, URBG& rnd) {
  const std::vector<double> payoffs = RepeatedGame::MatchPopulation(population, rounds);
  double total = 0.0;
  for (double p: payoffs) { total += p; }
  const double mean_payoff = total / (static_cast<double>(rounds) * static_cast<double>(population.size()));

  std::vector<double> distribution;
  try {
    distribution = FitnessSelector::ComputeDistribution(payoffs);
  }
  catch (const DegenerateFitness&) {
    throw DegenerateFitness(t);
  }

  std::vector<Automaton> next(population.begin() + speed, population.end());
  std::vector<Automaton> successors = FitnessSelector::Sample(distribution, population, static_cast<size_t>(speed), rnd);
  next.insert(next.end(), successors.begin(), successors.end());
  std::shuffle(next.begin(), next.end(), rnd);
  population = std::move(next);
  return mean_payoff;
}

// mean payoff of every cycle. throws before the first cycle on a bad configuration
template <typename URBG>
std::vector<double> Evolve(std::vector<Automaton> population, int64_t cycles, int64_t speed, int64_t rounds, URBG& rnd) {
  ValidateEvolution(population.size(), cycles, speed, rounds);
  std::vector<double> history;
  history.reserve(cycles);
  for (int64_t t = 0; t < cycles; t++) {
    history.push_back(EvolutionCycle(population, speed, rounds, t, rnd));
  }
  return history;
}


class EvoGame {
  public:
  class Parameters {
    public:
    Parameters() = default;
    int64_t N;        // population size
    int64_t T_max;    // number of cycles
    int64_t T_print;  // output interval
    int64_t speed;    // number of individuals replaced per cycle
    int64_t rounds;   // rounds per match
    std::string initial_condition; // "random", "ALLD", "ALLC", "TFT", "GRIM" or an automaton ID
    uint64_t _seed;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(Parameters, N, T_max, T_print, speed, rounds, initial_condition, _seed);
  };

  explicit EvoGame(Parameters _prm) : prm(std::move(_prm)), rnd(prm._seed) {
    ValidateEvolution(prm.N < 0 ? 0 : static_cast<size_t>(prm.N), prm.T_max, prm.speed, prm.rounds);
    if (prm.T_print < 1) { throw InvalidConfiguration("T_print must be positive"); }

    if (prm.initial_condition == "random") {
      population = GeneratePopulation(prm.N, rnd);
    }
    else {
      const Automaton a = Automaton::ConstructFromName(prm.initial_condition);
      population.assign(prm.N, a);
    }
  };
  Parameters prm;
  std::vector<Automaton> population;
  std::mt19937_64 rnd;

  double Update(int64_t t) {
    return EvolutionCycle(population, prm.speed, prm.rounds, t, rnd);
  }

  std::vector<double> Evolve() {
    std::vector<double> history;
    history.reserve(prm.T_max);
    for (int64_t t = 0; t < prm.T_max; t++) {
      history.push_back(Update(t));
      IC(t, history.back());
    }
    return history;
  }

  // fraction of the population whose first move is cooperation
  double CooperationLevel() const {
    double ans = 0.0;
    for (const Automaton& a: population) {
      if (a.CurrentAction() == Action::C) ans += 1.0;
    }
    return ans / (double)population.size();
  }

  size_t Count(const Automaton& target) const {
    return static_cast<size_t>(std::count(population.begin(), population.end(), target));
  }

  Automaton MostFrequent() const {
    std::map<uint64_t,size_t> freq;
    for (const Automaton& a: population) { freq[a.ID()] += 1; }
    uint64_t most_freq = population[0].ID();
    size_t max_freq = 0;
    for (const auto& p: freq) {
      if (p.second > max_freq) {
        most_freq = p.first;
        max_freq = p.second;
      }
    }
    return Automaton(most_freq);
  }

  double Diversity() const {
    // exponential Shannon entropy
    std::map<uint64_t,double> freq;
    for (const Automaton& a: population) {
      if (freq.find(a.ID()) == freq.end()) { freq[a.ID()] = 0.0; }
      freq[a.ID()] += 1.0;
    }
    double entropy = 0.0;
    for (auto pair: freq) {
      double p = pair.second / (double)population.size();
      entropy += -p * std::log(p);
    }
    return std::exp(entropy);
  }
};


#endif //CPP_EVO_GAME_HPP
