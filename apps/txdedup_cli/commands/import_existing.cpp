#include "import_existing.h"

#include "txdedup/core/ids.h"
#include "txdedup/domain/transaction_json.h"
#include "txdedup/storage/sqlite/sqlite_db.h"
#include "txdedup/storage/sqlite/sqlite_transaction_repository.h"

#include <nlohmann/json.hpp>

#include "shared/arg_parser.h"
#include "shared/json_input.h"
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct ImportCliConfig {
  std::optional<std::string> db_path;
  std::optional<std::string> user_id;
  std::optional<std::string> input_path;
};

}  // namespace

int cmd_import(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<txdedup::apps::Option<ImportCliConfig>> options = {
      {"--db", true, "Path to SQLite database file (created if missing)",
       [](ImportCliConfig& c, const std::string& v) {
         c.db_path = v;
         return true;
       }},
      {"--user", true, "Owner of the imported transactions",
       [](ImportCliConfig& c, const std::string& v) {
         c.user_id = v;
         return true;
       }},
      {"--input", true, "JSON file with existing transactions (- for stdin)",
       [](ImportCliConfig& c, const std::string& v) {
         c.input_path = v;
         return true;
       }},
  };
  const auto parsed = txdedup::apps::parse_options(argc, argv, options, 2);
  const auto& config = parsed.config;

  if (!parsed.ok || !config.db_path || !config.user_id || !config.input_path) {
    txdedup::apps::print_usage(
        std::cerr, "txdedup_cli import --db <path> --user <id> --input <existing.json>", options);
    return 1;
  }

  auto input = txdedup::apps::read_json_file(*config.input_path);
  if (!input.has_value()) {
    std::cerr << "Error: " << input.error() << "\n";
    return 1;
  }
  auto records = txdedup::domain::existing_records_from_json(input.value());
  if (!records.has_value()) {
    std::cerr << "Error: " << *config.input_path << ": " << records.error() << "\n";
    return 1;
  }

  auto db_result = txdedup::storage::sqlite::SqliteDb::open(*config.db_path);
  if (!db_result.has_value()) {
    std::cerr << "Failed to open database: " << db_result.error() << "\n";
    return 1;
  }

  auto db = db_result.value();
  auto schema_result = db->ensure_schema();
  if (!schema_result.has_value()) {
    std::cerr << "Failed to initialize schema: " << schema_result.error() << "\n";
    return 1;
  }

  txdedup::storage::sqlite::SqliteTransactionRepository repository(db);
  const txdedup::core::UserId user_id{*config.user_id};

  auto begin = db->exec("BEGIN TRANSACTION");
  if (!begin.has_value()) {
    std::cerr << "Error: " << begin.error() << "\n";
    return 1;
  }

  std::size_t undated = 0;
  try {
    for (const auto& record : records.value()) {
      if (!record.parsed_date().has_value()) {
        ++undated;
      }
      repository.upsert(user_id, record);
    }
  } catch (const std::exception& e) {
    auto rollback = db->exec("ROLLBACK");
    if (!rollback.has_value()) {
      std::cerr << "Error: " << rollback.error() << "\n";
    }
    std::cerr << "Import failed: " << e.what() << "\n";
    return 1;
  }

  auto commit = db->exec("COMMIT");
  if (!commit.has_value()) {
    std::cerr << "Error: " << commit.error() << "\n";
    return 1;
  }

  if (undated > 0) {
    std::cerr << "Warning: " << undated
              << " record(s) have no parsable date and will never be fetched for detection\n";
  }

  const nlohmann::json out = {
      {"user_id", user_id.value},
      {"imported", records.value().size()},
  };
  std::cout << out.dump(2) << "\n";
  return 0;
}
