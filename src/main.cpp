#include "hitlgate/cli/commands.hpp"

int main(int argc, char **argv) { return hitlgate::cli::run_cli(argc, argv); }
