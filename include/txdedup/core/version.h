#pragma once

namespace txdedup::core {

// Printed by `txdedup_cli --version` and stamped on DetectionStarted audit events.
inline constexpr const char* kEngineVersion = "1.2.0";

// Newest SQLite schema SqliteDb::ensure_schema applies (v1 transactions, v2 audit events).
inline constexpr int kSchemaVersion = 2;

}  // namespace txdedup::core
