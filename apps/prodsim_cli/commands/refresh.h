#pragma once

// cmd_refresh: run one refresh cycle (embed, index, regenerate alerts) and print its summary.
// Usage: prodsim refresh --db <path> [--modalities text,image] [--max-concurrency N] ...
// Exit code 0 when the run completed, 1 otherwise. Per-item failures do not fail the run.
int cmd_refresh(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
