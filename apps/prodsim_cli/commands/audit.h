#pragma once

// cmd_audit: print the audit events of one trace (a refresh run_id or a request trace_id).
// Usage: prodsim audit <trace_id> --db <path>
int cmd_audit(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// cmd_runs: print the recorded refresh runs, oldest first.
// Usage: prodsim runs --db <path>
int cmd_runs(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
