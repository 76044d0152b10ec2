#ifndef CPP_REPEATED_GAME_HPP
#define CPP_REPEATED_GAME_HPP

#include <vector>
#include <array>
#include <Eigen/Dense>
#include "Automaton.hpp"
#include "EvoErrors.hpp"

// repeated prisoner's dilemma with R=3, T=4, S=0, P=1
class RepeatedGame {
  public:
  using payoff_t = std::array<double,2>;

  // row player's payoff; rows and columns are indexed by Action (c=0, d=1)
  static const Eigen::Matrix2d& PayoffTable() {
    static const Eigen::Matrix2d table = (Eigen::Matrix2d() << 3.0, 0.0,
                                                               4.0, 1.0).finished();
    return table;
  }

  static payoff_t Payoff(Action a1, Action a2) {
    const auto i = static_cast<Eigen::Index>(a1), j = static_cast<Eigen::Index>(a2);
    return { PayoffTable()(i, j), PayoffTable()(j, i) };
  }

  // payoffs of each round, in the order they were played
  static std::vector<payoff_t> MatchPair(Automaton a1, Automaton a2, int64_t rounds) {
    if (rounds < 1) { throw InvalidConfiguration("rounds must be positive"); }
    std::vector<payoff_t> ans;
    ans.reserve(rounds);
    for (int64_t t = 0; t < rounds; t++) {
      const Action act1 = a1.CurrentAction(), act2 = a2.CurrentAction();
      ans.emplace_back(Payoff(act1, act2));
      a1 = a1.Step(act2);
      a2 = a2.Step(act1);
    }
    return ans;
  }

  static payoff_t TotalPayoffs(const Automaton& a1, const Automaton& a2, int64_t rounds) {
    payoff_t total = {0.0, 0.0};
    for (const payoff_t& p: MatchPair(a1, a2, rounds)) {
      total[0] += p[0];
      total[1] += p[1];
    }
    return total;
  }

  // slot 2i plays against slot 2i+1. the totals are placed back at the same slots
  static std::vector<double> MatchPopulation(const std::vector<Automaton>& population, int64_t rounds) {
    if (population.size() % 2 != 0) {
      throw InvalidConfiguration("population size must be even: " + std::to_string(population.size()));
    }
    if (rounds < 1) { throw InvalidConfiguration("rounds must be positive"); }
    std::vector<double> payoffs(population.size(), 0.0);
    for (size_t i = 0; i < population.size(); i += 2) {
      payoff_t p = TotalPayoffs(population[i], population[i+1], rounds);
      payoffs[i] = p[0];
      payoffs[i+1] = p[1];
    }
    return payoffs;
  }

  // (i,j) : mean payoff per round of players[i] against players[j]
  static Eigen::MatrixXd PayoffMatrix(const std::vector<Automaton>& players, int64_t rounds) {
    if (rounds < 1) { throw InvalidConfiguration("rounds must be positive"); }
    const auto n = static_cast<Eigen::Index>(players.size());
    Eigen::MatrixXd A(n, n);
    for (Eigen::Index i = 0; i < n; i++) {
      for (Eigen::Index j = i; j < n; j++) {
        payoff_t p = TotalPayoffs(players[i], players[j], rounds);
        A(i, j) = p[0] / static_cast<double>(rounds);
        A(j, i) = p[1] / static_cast<double>(rounds);
      }
    }
    return A;
  }
};

#endif //CPP_REPEATED_GAME_HPP
