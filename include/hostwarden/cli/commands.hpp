#pragma once

#include <string>

namespace hostwarden::cli {

[[nodiscard]] std::string version_string();
void print_help();

int run_cli(int argc, char **argv);

} // namespace hostwarden::cli
