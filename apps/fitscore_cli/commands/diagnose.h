#pragma once

// cmd_diagnose: inspect the configured embedding provider and the stored (or computed)
// embedding of each profile; prints a JSON report.
// Usage: fitscore_cli diagnose [--profiles <file>] [--config <file>]
int cmd_diagnose(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
