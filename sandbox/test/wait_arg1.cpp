#include <stdlib.h>

#include <chrono>
#include <thread>

int main(int argc, char** argv) {
  std::this_thread::sleep_for(std::chrono::duration<double>(atof(argv[1])));
  return 0;
}
