#pragma once

// cmd_embeddings: print the current and retired embedding versions of <item_id>, or
// with --rollback restore the newest retired version.
// Usage: prodsim embeddings <item_id> --db <path> [--modality text|image] [--rollback]
int cmd_embeddings(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
