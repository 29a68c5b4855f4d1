#include <taskd/cli.hpp>

#include <trantor/utils/Logger.h>

#include <cstdio>
#include <iostream>

int main(int argc, char** argv) {
  // Keep stdout for JSON output.
  trantor::Logger::setOutputFunction(
      [](const char* msg, const uint64_t len) { std::fwrite(msg, 1, len, stderr); },
      []() { std::fflush(stderr); });
  trantor::Logger::setLogLevel(trantor::Logger::kWarn);

  return taskd::RunCli(argc, argv, std::cout, std::cerr);
}
