#include <iostream>
#include <vector>
#include <fstream>
#include <chrono>
#include <nlohmann/json.hpp>
#include "icecream-cpp/icecream.hpp"
#include "EvoGame.hpp"


std::string prev_key;
std::chrono::system_clock::time_point start;
void MeasureElapsed(const std::string& key) {
  std::chrono::system_clock::time_point end = std::chrono::system_clock::now();
  if (!prev_key.empty()) {
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(end-start).count();
    std::cerr << "T " << prev_key << " finished in " << elapsed << " ms" << std::endl;
  }
  start = end;
  prev_key = key;
}


int main(int argc, char *argv[]) {
  icecream::ic.disable();
  if( argc != 2 ) {
    std::cerr << "Error : invalid argument" << std::endl;
    std::cerr << "  Usage : " << argv[0] << " <parameter_json_file>" << std::endl;
    return 1;
  }

  EvoGame::Parameters prm;
  {
    std::ifstream fin(argv[1]);
    if (!fin) {
      std::cerr << "Error : cannot open " << argv[1] << std::endl;
      return 1;
    }
    nlohmann::json input;
    fin >> input;
    prm = input.get<EvoGame::Parameters>();
  }
  IC(nlohmann::json(prm).dump());

  MeasureElapsed("initialize");

  try {
    EvoGame eco(prm);
    IC(eco.population);

    MeasureElapsed("simulation");

    for (int64_t t = 0; t < prm.T_max; t++) {
      double mean_payoff = eco.Update(t);
      if (t % prm.T_print == prm.T_print - 1) {
        std::cout << t << ' ' << mean_payoff << ' ' << eco.CooperationLevel() << ' '
                  << eco.Diversity() << ' ' << eco.MostFrequent().Name() << std::endl;
        IC(t, eco.population);
      }
    }
  }
  catch (const InvalidConfiguration& e) {
    std::cerr << "Error : " << e.what() << std::endl;
    return 1;
  }
  catch (const DegenerateFitness& e) {
    std::cerr << "Error : " << e.what() << std::endl;
    return 1;
  }

  MeasureElapsed("done");
  return 0;
}
