#include "detect.h"

#include "detect_logic.h"

#include "txdedup/core/clock.h"
#include "txdedup/core/date.h"
#include "txdedup/core/id_generator.h"
#include "txdedup/core/services.h"
#include "txdedup/detection/scoring_config_json.h"
#include "txdedup/domain/transaction_json.h"
#include "txdedup/storage/sqlite/sqlite_audit_log.h"
#include "txdedup/storage/sqlite/sqlite_db.h"
#include "txdedup/storage/sqlite/sqlite_transaction_repository.h"

#include "shared/arg_parser.h"
#include "shared/json_input.h"
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct DetectCliConfig {
  std::optional<std::string> db_path;
  std::optional<std::string> user_id;
  std::optional<std::string> input_path;
  std::optional<std::string> config_path;
  std::optional<std::string> today;
  bool show_trace{false};
};

const std::vector<txdedup::apps::Option<DetectCliConfig>>& detect_options() {
  static const std::vector<txdedup::apps::Option<DetectCliConfig>> options = {
      {"--db", true, "Path to SQLite database file holding the user's history",
       [](DetectCliConfig& c, const std::string& v) {
         c.db_path = v;
         return true;
       }},
      {"--user", true, "User whose history is searched",
       [](DetectCliConfig& c, const std::string& v) {
         c.user_id = v;
         return true;
       }},
      {"--input", true, "JSON file with the candidate batch (- for stdin)",
       [](DetectCliConfig& c, const std::string& v) {
         c.input_path = v;
         return true;
       }},
      {"--config", true, "JSON file overriding scoring thresholds",
       [](DetectCliConfig& c, const std::string& v) {
         c.config_path = v;
         return true;
       }},
      {"--today", true, "Reference date (YYYY-MM-DD) for batches without dates",
       [](DetectCliConfig& c, const std::string& v) {
         if (!txdedup::core::parse_iso_date(v).has_value()) {
           std::cerr << "Invalid --today: " << v << " (expected YYYY-MM-DD)\n";
           return false;
         }
         c.today = v;
         return true;
       }},
      {"--show-trace", false, "Include the audit trace of the run in the output",
       [](DetectCliConfig& c, const std::string& /*v*/) {
         c.show_trace = true;
         return true;
       }},
  };
  return options;
}

}  // namespace

int cmd_detect(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto& options = detect_options();
  const auto parsed = txdedup::apps::parse_options(argc, argv, options, 2);
  const auto& config = parsed.config;

  if (!parsed.ok || !config.db_path || !config.user_id || !config.input_path) {
    txdedup::apps::print_usage(
        std::cerr, "txdedup_cli detect --db <path> --user <id> --input <candidates.json>",
        options);
    return 1;
  }

  txdedup::app::DetectionPipelineRequest req;
  req.user_id = txdedup::core::UserId{*config.user_id};

  if (config.config_path.has_value()) {
    auto scoring = txdedup::detection::load_scoring_config(*config.config_path);
    if (!scoring.has_value()) {
      std::cerr << "Error: " << scoring.error() << "\n";
      return 1;
    }
    req.config = scoring.value();
  }

  auto input = txdedup::apps::read_json_file(*config.input_path);
  if (!input.has_value()) {
    std::cerr << "Error: " << input.error() << "\n";
    return 1;
  }
  auto candidates = txdedup::domain::candidates_from_json(input.value());
  if (!candidates.has_value()) {
    std::cerr << "Error: " << *config.input_path << ": " << candidates.error() << "\n";
    return 1;
  }
  req.candidates = candidates.value();

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

  txdedup::storage::sqlite::SqliteTransactionRepository transactions(db);
  txdedup::storage::sqlite::SqliteAuditLog audit_log(db);
  txdedup::core::Services services{transactions, audit_log};

  txdedup::core::SystemIdGenerator id_gen;
  std::unique_ptr<txdedup::core::IClock> clock;
  if (config.today.has_value()) {
    clock = std::make_unique<txdedup::core::FixedClock>(*config.today + "T00:00:00Z");
  } else {
    clock = std::make_unique<txdedup::core::SystemClock>();
  }

  try {
    return execute_detect(req, services, id_gen, *clock, config.show_trace, std::cout);
  } catch (const std::exception& e) {
    std::cerr << "Detection failed: " << e.what() << "\n";
    return 1;
  }
}
