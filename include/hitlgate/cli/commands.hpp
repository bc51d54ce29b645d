#pragma once

namespace hitlgate::cli {

int run_cli(int argc, char **argv);

} // namespace hitlgate::cli
