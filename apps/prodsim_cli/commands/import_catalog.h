#pragma once

// cmd_import_catalog: load items and reviews from a JSON document into the catalog tables.
// Usage: prodsim import-catalog <file.json> --db <path>
int cmd_import_catalog(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
