#pragma once

namespace leakguard::cli {

void print_help();
[[nodiscard]] int run_cli(int argc, char **argv);

} // namespace leakguard::cli
