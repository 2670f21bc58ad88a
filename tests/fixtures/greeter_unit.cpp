// Test unit library. Built as <test_units>/fixtures/Greeter.so.

#include <cstddef>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "forklift/launch/entry_point.hpp"

namespace {

// args[0] is an output file; the remaining arguments are written after
// "hello". A second argument of "--fail" throws instead.
void Greet(const forklift::launch::ArgumentList& args) {
  if (args.empty()) {
    throw std::invalid_argument("greeter: missing output file");
  }
  if (args.size() > 1 && args[1] == "--fail") {
    throw std::runtime_error("greeter: asked to fail");
  }
  std::ofstream out(args[0]);
  out << "hello";
  for (size_t i = 1; i < args.size(); ++i) {
    out << ' ' << args[i];
  }
}

void Farewell(const forklift::launch::ArgumentList& args) {
  if (args.empty()) {
    throw std::invalid_argument("farewell: missing output file");
  }
  std::ofstream out(args[0]);
  out << "goodbye";
}

}  // namespace

FORKLIFT_ENTRY_POINT(fixtures_Greeter, Greet)
FORKLIFT_ENTRY_POINT(fixtures_Farewell, Farewell)

// Written out by hand instead of through the macro.
extern "C" __attribute__((visibility("default"))) void
forklift_main_fixtures_Plain(const std::vector<std::string>& args) {
  if (args.empty()) {
    throw std::invalid_argument("plain: missing output file");
  }
  std::ofstream out(args[0]);
  out << "plain";
}
