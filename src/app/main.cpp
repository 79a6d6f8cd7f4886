#include "app/runtime_runner.hpp"

int main(int argc, char** argv) { return run_cli_impl(argc, argv); }
