#pragma once

// cmd_import: load a user's existing transactions into the SQLite history.
// Usage: txdedup_cli import --db <db-path> --user <user-id> --input <existing.json>
// Records are upserted by transaction_id inside one SQL transaction.
int cmd_import(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
