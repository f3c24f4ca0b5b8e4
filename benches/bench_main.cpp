#include <iostream>

void run_config_benchmark();
void run_scan_benchmark();
void run_guard_benchmark();

int main() {
  std::cout << "LeakGuard Benchmarks\n";
  run_config_benchmark();
  run_scan_benchmark();
  run_guard_benchmark();
  return 0;
}
