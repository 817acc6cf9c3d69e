#include "snapseek/cli/commands.hpp"

int main(int argc, char **argv) { return snapseek::cli::run_cli(argc, argv); }
