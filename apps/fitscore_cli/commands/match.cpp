#include "match.h"

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

struct MatchCliConfig {
  std::optional<std::string> candidate_path;
  std::optional<std::string> job_path;
  std::optional<std::string> config_path;
};

}  // namespace

int cmd_match(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<fitscore::apps::Option<MatchCliConfig>> options = {
      {"--candidate", "file", "Candidate profile JSON file", true,
       [](MatchCliConfig& c, const std::string& v) {
         c.candidate_path = v;
         return true;
       }},
      {"--job", "file", "Job profile JSON file", true,
       [](MatchCliConfig& c, const std::string& v) {
         c.job_path = v;
         return true;
       }},
      {"--config", "file", "Engine configuration JSON file", false,
       [](MatchCliConfig& c, const std::string& v) {
         c.config_path = v;
         return true;
       }},
  };
  const auto parsed = fitscore::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok) {
    std::cerr << fitscore::apps::format_usage("match", options);
    return 1;
  }
  const auto& cli = parsed.config;

  const auto config = load_cli_config(cli.config_path);
  if (!config.has_value()) {
    return 1;
  }
  const auto candidate = load_profile_file(*cli.candidate_path);
  const auto job = load_profile_file(*cli.job_path);
  if (!candidate.has_value() || !job.has_value()) {
    return 1;
  }

  try {
    const fitscore::config::EmbeddingRuntime runtime(config->embedding);
    const fitscore::matching::Matcher matcher(config->weights, &runtime.provider());
    const auto result = matcher.evaluate(*candidate, *job);
    std::cout << fitscore::domain::to_json(result).dump(2) << "\n";
  } catch (const std::exception& e) {
    std::cerr << "Error: match failed: " << e.what() << "\n";
    return 1;
  }

  return 0;
}
