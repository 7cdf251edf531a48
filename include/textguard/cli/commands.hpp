#pragma once

#include <string>

namespace textguard::cli {

[[nodiscard]] std::string version_string();
void print_help();
int run_cli(int argc, char **argv);

} // namespace textguard::cli
