#include "rank.h"

#include "engine_setup.h"
#include "fitscore/config/embedding_runtime.h"
#include "fitscore/domain/match_json.h"
#include "fitscore/matching/matcher.h"

#include "shared/arg_parser.h"

#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct RankCliConfig {
  std::optional<std::string> job_path;
  std::optional<std::string> candidates_path;
  std::optional<std::string> config_path;
  std::optional<std::size_t> top_k;
  std::optional<std::size_t> parallel;
};

}  // namespace

int cmd_rank(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<fitscore::apps::Option<RankCliConfig>> options = {
      {"--job", "file", "Job profile JSON file", true,
       [](RankCliConfig& c, const std::string& v) {
         c.job_path = v;
         return true;
       }},
      {"--candidates", "file", "JSON array of candidate profiles", true,
       [](RankCliConfig& c, const std::string& v) {
         c.candidates_path = v;
         return true;
       }},
      {"--config", "file", "Engine configuration JSON file", false,
       [](RankCliConfig& c, const std::string& v) {
         c.config_path = v;
         return true;
       }},
      {"--top-k", "N", "Keep only the N best candidates (0 = all)", false,
       [](RankCliConfig& c, const std::string& v) {
         c.top_k = fitscore::apps::parse_count(v);
         if (!c.top_k.has_value()) {
           std::cerr << "Invalid --top-k: " << v << " (expected a non-negative integer)\n";
           return false;
         }
         return true;
       }},
      {"--parallel", "N", "Worker threads for candidate evaluation", false,
       [](RankCliConfig& c, const std::string& v) {
         c.parallel = fitscore::apps::parse_count(v);
         if (!c.parallel.has_value()) {
           std::cerr << "Invalid --parallel: " << v << " (expected a non-negative integer)\n";
           return false;
         }
         return true;
       }},
  };
  const auto parsed = fitscore::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok) {
    std::cerr << fitscore::apps::format_usage("rank", options);
    return 1;
  }
  const auto& cli = parsed.config;

  const auto config = load_cli_config(cli.config_path);
  if (!config.has_value()) {
    return 1;
  }
  const auto job = load_profile_file(*cli.job_path);
  const auto candidates = load_profiles_file(*cli.candidates_path);
  if (!job.has_value() || !candidates.has_value()) {
    return 1;
  }

  fitscore::matching::BatchOptions batch;
  batch.max_parallelism = cli.parallel.value_or(config->batch.max_parallelism);
  batch.top_k = cli.top_k.value_or(config->batch.top_k);

  try {
    const fitscore::config::EmbeddingRuntime runtime(config->embedding);
    const fitscore::matching::Matcher matcher(config->weights, &runtime.provider());
    const auto report = matcher.evaluate_batch(*job, *candidates, batch);
    std::cout << fitscore::domain::to_json(report).dump(2) << "\n";
  } catch (const std::exception& e) {
    std::cerr << "Error: rank failed: " << e.what() << "\n";
    return 1;
  }

  return 0;
}
