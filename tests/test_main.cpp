#include <iostream>

#include "test.h"

int test_stochastic();
int test_complex_events();
int test_conflict();
int test_war_lifecycle();
int test_encounter();
int test_scheduler();
int test_scheduler_events();
int test_serialization();
int test_state_validation();
int test_json_errors();
int test_file_io();
int test_persistence();

int main() {
  int fails = 0;
  fails += test_stochastic();
  fails += test_complex_events();
  fails += test_conflict();
  fails += test_war_lifecycle();
  fails += test_encounter();
  fails += test_scheduler();
  fails += test_scheduler_events();
  fails += test_serialization();
  fails += test_state_validation();
  fails += test_json_errors();
  fails += test_file_io();
  fails += test_persistence();

  if (fails == 0) {
    std::cout << "All tests passed\n";
    return 0;
  }
  std::cerr << fails << " tests failed\n";
  return 1;
}
