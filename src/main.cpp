#include "leakguard/cli/commands.hpp"

int main(int argc, char **argv) { return leakguard::cli::run_cli(argc, argv); }
