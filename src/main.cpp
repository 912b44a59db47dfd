#include "vesper/cli/commands.hpp"

int main(int argc, char **argv) { return vesper::cli::run_cli(argc, argv); }
