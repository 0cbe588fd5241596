#include "chatfetch/cli/commands.hpp"

int main(int argc, char **argv) { return chatfetch::cli::run_cli(argc, argv); }
