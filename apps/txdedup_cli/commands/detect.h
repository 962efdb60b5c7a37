#pragma once

// cmd_detect: classify a batch of candidate transactions against stored history.
// Usage: txdedup_cli detect --db <db-path> --user <user-id> --input <candidates.json>
//                           [--config <scoring.json>] [--today YYYY-MM-DD] [--show-trace]
int cmd_detect(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
