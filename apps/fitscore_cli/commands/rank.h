#pragma once

// cmd_rank: rank many candidates against one job and print the BatchMatchReport as JSON.
// Usage: fitscore_cli rank --job <file> --candidates <file> [--config <file>]
//                          [--top-k N] [--parallel N]
// --top-k and --parallel override the batch section of the configuration.
int cmd_rank(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
