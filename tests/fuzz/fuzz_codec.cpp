#include "trust/Codec.h"
#include <cstddef>
#include <cstdint>
#include <string>

using namespace trust;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
  std::string text(reinterpret_cast<const char*>(data), size);
  auto sample = parse_sample(text);
  auto cfg = parse_gate_config(text);
  if (sample.ok) {
    AuthGate gate(cfg.ok ? cfg.config : AuthGateConfig{});
    (void)to_json(gate.evaluate(sample.sample, BaselineProfile{}));
  }
  return 0;
}
