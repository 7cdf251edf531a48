#include <iostream>

void run_scan_benchmarks();
void run_clean_benchmarks();

int main() {
  std::cout << "textguard benchmarks\n";
  run_scan_benchmarks();
  run_clean_benchmarks();
  return 0;
}
