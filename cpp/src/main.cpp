#include "arguments.hpp"
#include "pipeline.hpp"
#include "shared.hpp"

#include <iostream>

using namespace shared;


// Exit codes.
enum status : int {SUCCESS = 0, FAILURE = 1, USAGE = 2};


[[noreturn]] static void error(const list& msg, const status& code = FAILURE) {
  std::cerr << "ERROR: ";
  for (const auto& x : msg) std::cerr << x << ' ';
  std::cerr << std::endl;
  exit(code);
}


// Main
int main(int argc, char* argv[]) {

  // Parse those args.
  arg::args = vector(argv + 1, argv + argc);
  try {
    arg::parse_args();
  }
  catch (const std::runtime_error& e) {
    error({"Failed to parse arguments:", e.what(), "\nSee --help"}, USAGE);
  }

  // One index for the run.
  registry::Index index;
  try {
    pipeline::run(index);
  }
  catch (const std::exception& e) {
    error({e.what()});
  }

  log({"Finished with", std::to_string(warnings()), "warnings"});
  return SUCCESS;
}
