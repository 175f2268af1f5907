#include "fitscore/config/engine_config.h"

#include <nlohmann/json.hpp>

#include <cmath>
#include <fstream>
#include <optional>
#include <sstream>

namespace fitscore::config {

namespace {

using ConfigResult = core::Result<EngineConfig, std::string>;

void read_weights(const nlohmann::json& j, matching::ScoreWeights& w) {
  w.similarity = j.value("similarity", w.similarity);
  w.technical = j.value("technical", w.technical);
  w.experience = j.value("experience", w.experience);
  w.education = j.value("education", w.education);
  w.soft_skills = j.value("soft_skills", w.soft_skills);
}

// read_count reads an optional non-negative integer. nlohmann converts a negative
// integer to size_t by wrapping, so the JSON type is checked first.
std::optional<std::string> read_count(const nlohmann::json& section, const char* section_name,
                                      const char* key, std::size_t& out) {
  if (!section.contains(key)) {
    return std::nullopt;
  }
  const auto& value = section.at(key);
  if (!value.is_number_unsigned()) {
    return std::string(section_name) + "." + key + " must be a non-negative integer";
  }
  out = value.get<std::size_t>();
  return std::nullopt;
}

}  // namespace

std::string backend_name(const EmbeddingBackend backend) {
  switch (backend) {
    case EmbeddingBackend::kStub:
      return "stub";
    case EmbeddingBackend::kNone:
      return "none";
    case EmbeddingBackend::kUnavailable:
      return "unavailable";
  }
  return "stub";
}

std::optional<EmbeddingBackend> parse_backend(const std::string& name) {
  if (name == "stub") {
    return EmbeddingBackend::kStub;
  }
  if (name == "none") {
    return EmbeddingBackend::kNone;
  }
  if (name == "unavailable") {
    return EmbeddingBackend::kUnavailable;
  }
  return std::nullopt;
}

core::Result<bool, std::string> validate_weights(const matching::ScoreWeights& w) {
  const std::pair<const char*, double> entries[] = {
      {"similarity", w.similarity}, {"technical", w.technical},
      {"experience", w.experience}, {"education", w.education},
      {"soft_skills", w.soft_skills},
  };
  for (const auto& [name, value] : entries) {
    if (!std::isfinite(value) || value < 0.0) {
      return core::Result<bool, std::string>::err(std::string("weight '") + name +
                                                  "' must be a non-negative number");
    }
  }
  return core::Result<bool, std::string>::ok(true);
}

ConfigResult parse_engine_config(const std::string& json_str) {
  EngineConfig config;
  try {
    const auto j = nlohmann::json::parse(json_str);
    if (!j.is_object()) {
      return ConfigResult::err("configuration must be a JSON object");
    }

    if (j.contains("weights")) {
      read_weights(j.at("weights"), config.weights);
    }

    if (j.contains("embedding")) {
      const auto& e = j.at("embedding");
      const auto backend = e.value("backend", backend_name(config.embedding.backend));
      const auto parsed = parse_backend(backend);
      if (!parsed.has_value()) {
        return ConfigResult::err("unknown embedding backend '" + backend +
                                 "' (valid: stub, none, unavailable)");
      }
      config.embedding.backend = *parsed;
      if (auto error = read_count(e, "embedding", "dimension", config.embedding.dimension)) {
        return ConfigResult::err(*error);
      }
      config.embedding.model_id = e.value("model_id", config.embedding.model_id);
      if (e.contains("cache_path") && !e.at("cache_path").is_null()) {
        config.embedding.cache_path = e.at("cache_path").get<std::string>();
      }
    }

    if (j.contains("batch")) {
      const auto& b = j.at("batch");
      if (!b.is_object()) {
        return ConfigResult::err("batch must be a JSON object");
      }
      if (auto error = read_count(b, "batch", "max_parallelism", config.batch.max_parallelism)) {
        return ConfigResult::err(*error);
      }
      if (auto error = read_count(b, "batch", "top_k", config.batch.top_k)) {
        return ConfigResult::err(*error);
      }
    }

    config.log_level = j.value("log_level", config.log_level);
  } catch (const nlohmann::json::exception& e) {
    return ConfigResult::err(std::string("invalid configuration JSON: ") + e.what());
  }

  const auto weights_ok = validate_weights(config.weights);
  if (!weights_ok.has_value()) {
    return ConfigResult::err(weights_ok.error());
  }
  if (config.embedding.dimension == 0) {
    return ConfigResult::err("embedding dimension must be positive");
  }

  return ConfigResult::ok(std::move(config));
}

ConfigResult load_engine_config(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    return ConfigResult::err("cannot open configuration file: " + path);
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return parse_engine_config(buffer.str());
}

std::string to_json(const EngineConfig& config) {
  using json = nlohmann::json;

  json j;
  j["batch"] = {{"max_parallelism", config.batch.max_parallelism},
                {"top_k", config.batch.top_k}};
  j["embedding"] = {{"backend", backend_name(config.embedding.backend)},
                    {"dimension", config.embedding.dimension},
                    {"model_id", config.embedding.model_id}};
  if (config.embedding.cache_path.has_value()) {
    j["embedding"]["cache_path"] = *config.embedding.cache_path;
  }
  j["log_level"] = config.log_level;
  j["weights"] = {{"education", config.weights.education},
                  {"experience", config.weights.experience},
                  {"similarity", config.weights.similarity},
                  {"soft_skills", config.weights.soft_skills},
                  {"technical", config.weights.technical}};

  return j.dump();
}

}  // namespace fitscore::config
