#include <iostream>

void run_config_benchmark();
void run_registry_benchmark();
void run_json_benchmark();

int main() {
  std::cout << "hitlgate benchmarks\n";
  run_config_benchmark();
  run_registry_benchmark();
  run_json_benchmark();
  return 0;
}
