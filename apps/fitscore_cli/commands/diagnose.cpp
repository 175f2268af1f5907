#include "diagnose.h"

#include "engine_setup.h"
#include "fitscore/config/embedding_runtime.h"
#include "fitscore/diagnostics/embedding_diagnostics.h"

#include <nlohmann/json.hpp>

#include "shared/arg_parser.h"

#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct DiagnoseCliConfig {
  std::optional<std::string> profiles_path;
  std::optional<std::string> config_path;
};

nlohmann::json inspection_to_json(const fitscore::diagnostics::EmbeddingInspection& inspection) {
  nlohmann::json j;
  j["status"] = std::string(fitscore::diagnostics::status_name(inspection.status));
  j["dimension"] = inspection.dimension;
  j["dimension_matches"] = inspection.dimension_matches;
  j["norm"] = inspection.norm;
  j["preview"] = inspection.preview;
  return j;
}

}  // namespace

int cmd_diagnose(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<fitscore::apps::Option<DiagnoseCliConfig>> options = {
      {"--profiles", "file", "Profile JSON file (object or array)", false,
       [](DiagnoseCliConfig& c, const std::string& v) {
         c.profiles_path = v;
         return true;
       }},
      {"--config", "file", "Engine configuration JSON file", false,
       [](DiagnoseCliConfig& c, const std::string& v) {
         c.config_path = v;
         return true;
       }},
  };
  const auto parsed = fitscore::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok) {
    std::cerr << fitscore::apps::format_usage("diagnose", options);
    return 1;
  }
  const auto& cli = parsed.config;

  const auto config = load_cli_config(cli.config_path);
  if (!config.has_value()) {
    return 1;
  }

  std::vector<fitscore::domain::Profile> profiles;
  if (cli.profiles_path.has_value()) {
    auto loaded = load_profiles_file(*cli.profiles_path);
    if (!loaded.has_value()) {
      return 1;
    }
    profiles = std::move(*loaded);
  }

  try {
    const fitscore::config::EmbeddingRuntime runtime(config->embedding);
    const auto& provider = runtime.provider();

    const auto check = fitscore::diagnostics::check_provider(provider);
    nlohmann::json out;
    out["provider"] = {
        {"model_id", check.model_id},
        {"dimension", check.dimension},
        {"emits_placeholders", check.emits_placeholders},
        {"emits_empty", check.emits_empty},
        {"related_similarity", check.related_similarity},
        {"unrelated_similarity", check.unrelated_similarity},
        {"ranks_related_higher", check.ranks_related_higher},
    };

    out["profiles"] = nlohmann::json::array();
    for (const auto& profile : profiles) {
      const bool stored = !profile.embedding.empty();
      const auto vector = stored ? profile.embedding : provider.embed_text(profile.text);
      nlohmann::json entry = inspection_to_json(
          fitscore::diagnostics::inspect_embedding(vector, config->embedding.dimension));
      entry["id"] = profile.id;
      entry["source"] = stored ? "stored" : "computed";
      out["profiles"].push_back(entry);
    }

    std::cout << out.dump(2) << "\n";
  } catch (const std::exception& e) {
    std::cerr << "Error: diagnose failed: " << e.what() << "\n";
    return 1;
  }

  return 0;
}
