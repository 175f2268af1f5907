#pragma once

// cmd_match: score one candidate against one job and print the MatchResult as JSON.
// Usage: fitscore_cli match --candidate <file> --job <file> [--config <file>]
int cmd_match(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
