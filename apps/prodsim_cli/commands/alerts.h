#pragma once

// cmd_alerts: print the current quality alerts, most severe first.
// Usage: prodsim alerts --db <path> [--min-level OK|MONITOR|MEDIUM_RISK|HIGH_RISK]
// The default minimum level is MEDIUM_RISK.
int cmd_alerts(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
