#include <iostream>

void test_signal_rules();
void test_signal_spec();
void test_precheck();
void test_scorer();
void test_auth_gate();
void test_codec();

int main() {
  test_signal_rules();
  test_signal_spec();
  test_precheck();
  test_scorer();
  test_auth_gate();
  test_codec();
  std::cout << "trust_tests ok\n";
  return 0;
}
