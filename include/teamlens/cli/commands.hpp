#pragma once

namespace teamlens::cli {

void print_help();
[[nodiscard]] int run_cli(int argc, char **argv);

} // namespace teamlens::cli
