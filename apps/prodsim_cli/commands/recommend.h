#pragma once

// cmd_recommend: print the k items most similar to <item_id>.
// Usage: prodsim recommend <item_id> --db <path> [--k N] [--modality text|image]
//                          [--explain] [--max-distance D] [--staleness-threshold-ms MS]
int cmd_recommend(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
