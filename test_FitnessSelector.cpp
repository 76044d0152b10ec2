#include <iostream>
#include <vector>
#include <random>
#include <cmath>
#include <cstdio>
#include "FitnessSelector.hpp"

#define myassert(x) do {                              \
if (!(x)) {                                           \
printf("Assertion failed: %s, file %s, line %d\n"   \
, #x, __FILE__, __LINE__);                   \
exit(1);                                            \
}                                                   \
} while (0)

bool IsClose(double x, double y, double tol = 1.0e-12) {
  return std::abs(x-y) < tol;
}

void test_ComputeDistribution() {
  std::vector<double> d = FitnessSelector::ComputeDistribution({1.0, 3.0, 5.0, 2.0, 9.0});
  myassert( d.size() == 6 );
  myassert( d[0] == 0.0 );
  myassert( IsClose(d[1], 1.0/20.0) );
  myassert( IsClose(d[2], 1.0/5.0) );
  myassert( IsClose(d[3], 9.0/20.0) );
  myassert( IsClose(d[4], 11.0/20.0) );
  myassert( d[5] == 1.0 );

  // non-decreasing, zero payoff gives a flat step
  std::vector<double> z = FitnessSelector::ComputeDistribution({0.0, 1.0, 0.0, 1.0});
  myassert( z.size() == 5 );
  for (size_t i = 1; i < z.size(); i++) { myassert( z[i] >= z[i-1] ); }
  myassert( z[1] == 0.0 );
  myassert( IsClose(z[2], 0.5) && IsClose(z[3], 0.5) );

  std::vector<double> many(1000, 7.0);
  std::vector<double> m = FitnessSelector::ComputeDistribution(many);
  myassert( m.back() == 1.0 );
  myassert( IsClose(m[500], 0.5, 1.0e-9) );
}

void test_DegenerateFitness() {
  bool thrown = false;
  try { FitnessSelector::ComputeDistribution({0.0, 0.0, 0.0, 0.0}); }
  catch (const DegenerateFitness& e) {
    thrown = true;
    myassert( e.Cycle() == -1 );
  }
  myassert(thrown);

  thrown = false;
  try { FitnessSelector::ComputeDistribution({1.0, -2.0}); }
  catch (const InvalidConfiguration& e) { thrown = true; }
  myassert(thrown);

  thrown = false;
  try { FitnessSelector::ComputeDistribution({}); }
  catch (const InvalidConfiguration& e) { thrown = true; }
  myassert(thrown);
}

void test_SampleIndex() {
  std::vector<double> d = FitnessSelector::ComputeDistribution({1.0, 3.0, 5.0, 2.0, 9.0});
  myassert( FitnessSelector::SampleIndex(d, 0.0) == 0 );
  myassert( FitnessSelector::SampleIndex(d, 0.0499) == 0 );
  myassert( FitnessSelector::SampleIndex(d, 0.1) == 1 );
  myassert( FitnessSelector::SampleIndex(d, 0.3) == 2 );
  myassert( FitnessSelector::SampleIndex(d, 0.5) == 3 );
  myassert( FitnessSelector::SampleIndex(d, 0.9999) == 4 );

  // individuals with zero payoff are never selected
  std::vector<double> z = FitnessSelector::ComputeDistribution({0.0, 1.0, 0.0, 1.0});
  myassert( FitnessSelector::SampleIndex(z, 0.0) == 1 );
  myassert( FitnessSelector::SampleIndex(z, 0.5) == 3 );
}

void test_Sample() {
  std::vector<Automaton> population = {Automaton::ALLD(), Automaton::ALLC(), Automaton::TFT(), Automaton::GRIM()};
  std::vector<double> d = FitnessSelector::ComputeDistribution({1.0, 1.0, 1.0, 7.0});
  std::mt19937_64 rnd(1234567890ull);

  myassert( FitnessSelector::Sample(d, population, 0, rnd).empty() );

  // with replacement: more draws than individuals
  const size_t COUNT = 10000;
  std::vector<Automaton> drawn = FitnessSelector::Sample(d, population, COUNT, rnd);
  myassert( drawn.size() == COUNT );
  size_t num_grim = 0, num_alld = 0;
  for (const Automaton& a: drawn) {
    if (a == Automaton::GRIM()) num_grim++;
    if (a == Automaton::ALLD()) num_alld++;
  }
  myassert( IsClose((double)num_grim / COUNT, 0.7, 0.03) );
  myassert( IsClose((double)num_alld / COUNT, 0.1, 0.03) );

  // a single positive payoff is always selected
  std::vector<double> single = FitnessSelector::ComputeDistribution({0.0, 0.0, 5.0, 0.0});
  for (const Automaton& a: FitnessSelector::Sample(single, population, 100, rnd)) {
    myassert( a == Automaton::TFT() );
  }

  bool thrown = false;
  try { FitnessSelector::Sample(d, {Automaton::ALLD(), Automaton::ALLC()}, 1, rnd); }
  catch (const InvalidConfiguration& e) { thrown = true; }
  myassert(thrown);
}

void test_SampleReproducible() {
  std::vector<Automaton> population = {Automaton::ALLD(), Automaton::ALLC(), Automaton::TFT(), Automaton::GRIM()};
  std::vector<double> d = FitnessSelector::ComputeDistribution({4.0, 3.0, 2.0, 1.0});
  std::mt19937_64 rnd1(7ull), rnd2(7ull);
  myassert( FitnessSelector::Sample(d, population, 50, rnd1) == FitnessSelector::Sample(d, population, 50, rnd2) );
}

int main(int argc, char* argv[]) {
  std::cerr << "Testing FitnessSelector class" << std::endl;
  test_ComputeDistribution();
  test_DegenerateFitness();
  test_SampleIndex();
  test_Sample();
  test_SampleReproducible();
  return 0;
}
