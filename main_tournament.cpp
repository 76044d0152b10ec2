#include <iostream>
#include <vector>
#include <fstream>
#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include "icecream-cpp/icecream.hpp"
#include "Automaton.hpp"
#include "RepeatedGame.hpp"


// prints the mean payoff per round of every pair of players
//   input: {"rounds": 10, "players": ["ALLD", "ALLC", "TFT", "GRIM", "37"]}
int main(int argc, char *argv[]) {
  icecream::ic.disable();
  if( argc != 2 ) {
    std::cerr << "Error : invalid argument" << std::endl;
    std::cerr << "  Usage : " << argv[0] << " <input_json_file>" << std::endl;
    return 1;
  }

  nlohmann::json input;
  {
    std::ifstream fin(argv[1]);
    if (!fin) {
      std::cerr << "Error : cannot open " << argv[1] << std::endl;
      return 1;
    }
    fin >> input;
  }

  try {
    const int64_t rounds = input.at("rounds").get<int64_t>();
    std::vector<Automaton> players;
    for (const nlohmann::json& _s: input.at("players")) {
      players.emplace_back(Automaton::ConstructFromName(_s.get<std::string>()));
    }
    IC(players);

    Eigen::MatrixXd A = RepeatedGame::PayoffMatrix(players, rounds);
    for (const Automaton& a: players) { std::cout << a.Name() << ' '; }
    std::cout << "\n" << A << std::endl;
  }
  catch (const InvalidConfiguration& e) {
    std::cerr << "Error : " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
