#include "trust/AuthGate.h"
#include "trust/Codec.h"
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

using namespace trust;

int main(int argc, char** argv) {
  AuthGateConfig cfg{};
  if (argc > 1) {
    std::ifstream in(argv[1]);
    if (!in) {
      std::cerr << "trust_eval: cannot open " << argv[1] << "\n";
      return 1;
    }
    std::stringstream buf;
    buf << in.rdbuf();
    auto parsed = parse_gate_config(buf.str());
    if (!parsed.ok) {
      std::cerr << "trust_eval: bad config " << argv[1] << ": "
                << config_error_name(parsed.error) << " " << parsed.detail << "\n";
      return 1;
    }
    cfg = parsed.config;
  }

  AuthGate gate(cfg);
  std::string line;
  while (std::getline(std::cin, line)) {
    if (line.empty()) continue;
    std::cout << handle_eval_request(gate, line).dump() << "\n";
    std::cout.flush();
  }
  return 0;
}
