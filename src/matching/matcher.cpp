#include "fitscore/matching/matcher.h"

#include "fitscore/explain/explanation_generator.h"
#include "fitscore/matching/detailed_scorer.h"
#include "fitscore/matching/score_combiner.h"
#include "fitscore/matching/similarity.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <future>
#include <optional>
#include <system_error>
#include <thread>

namespace fitscore::matching {

namespace {

// Outcome of one pair inside a batch: a result, or the failure that replaced it.
struct PairOutcome {
  std::optional<domain::MatchResult> result;
  std::optional<domain::BatchFailure> failure;
};

}  // namespace

std::size_t batch_worker_count(const std::size_t max_parallelism,
                               const std::size_t candidate_count) {
  const std::size_t hardware = std::max(1u, std::thread::hardware_concurrency());
  return std::max<std::size_t>(1, std::min({max_parallelism, candidate_count, hardware}));
}

Matcher::Matcher(const ScoreWeights weights,
                 const embedding::IEmbeddingProvider* embedding_provider)
    : weights_(weights), embedding_provider_(embedding_provider) {}

vector::Vector Matcher::resolve_embedding(const domain::Profile& profile) const {
  if (!profile.embedding.empty()) {
    return profile.embedding;
  }
  if (embedding_provider_ == nullptr || profile.text.empty()) {
    return {};
  }
  return embedding_provider_->embed_text(profile.text);
}

domain::MatchResult Matcher::score_pair(const domain::Profile& candidate,
                                        const domain::Profile& job,
                                        const vector::Vector& job_vector) const {
  domain::MatchResult result;
  result.candidate_id = candidate.id;
  result.job_id = job.id;

  const auto sim = similarity(resolve_embedding(candidate), job_vector);
  result.similarity = sim.value;
  result.similarity_fallback = sim.fallback;

  result.sub_scores = detailed_scores(candidate, job);
  result.overall_score = combine_scores(result.similarity, result.sub_scores, weights_);
  result.explanation = explain::explain(candidate, job, result.sub_scores, result.overall_score);

  return result;
}

domain::MatchResult Matcher::evaluate(const domain::Profile& candidate,
                                      const domain::Profile& job) const {
  const auto normalized_candidate = domain::normalize_profile(candidate);
  const auto normalized_job = domain::normalize_profile(job);
  return score_pair(normalized_candidate, normalized_job, resolve_embedding(normalized_job));
}

domain::BatchMatchReport Matcher::evaluate_batch(const domain::Profile& job,
                                                 const std::vector<domain::Profile>& candidates,
                                                 const BatchOptions& options) const {
  const auto normalized_job = domain::normalize_profile(job);
  const auto job_vector = resolve_embedding(normalized_job);

  std::vector<PairOutcome> outcomes(candidates.size());

  // Each worker owns a disjoint stride of outcome slots.
  auto run_stride = [&](const std::size_t first, const std::size_t stride) {
    for (std::size_t i = first; i < candidates.size(); i += stride) {
      try {
        outcomes[i].result =
            score_pair(domain::normalize_profile(candidates[i]), normalized_job, job_vector);
      } catch (const std::exception& e) {
        spdlog::error("batch match: candidate '{}' (index {}) failed: {}", candidates[i].id, i,
                      e.what());
        outcomes[i].failure = domain::BatchFailure{candidates[i].id, i, e.what()};
      }
    }
  };

  const std::size_t workers = batch_worker_count(options.max_parallelism, candidates.size());
  if (workers <= 1) {
    run_stride(0, 1);
  } else {
    std::vector<std::future<void>> futures;
    futures.reserve(workers);
    std::size_t launched = 0;
    try {
      for (; launched < workers; ++launched) {
        futures.push_back(std::async(std::launch::async, run_stride, launched, workers));
      }
    } catch (const std::system_error& e) {
      spdlog::warn("batch match: could only start {} of {} workers ({}); running the rest inline",
                   launched, workers, e.what());
    }
    for (std::size_t w = launched; w < workers; ++w) {
      run_stride(w, workers);
    }
    for (auto& future : futures) {
      future.get();
    }
  }

  domain::BatchMatchReport report;
  report.job_id = normalized_job.id;
  for (auto& outcome : outcomes) {
    if (outcome.result.has_value()) {
      report.ranked.push_back(std::move(*outcome.result));
    } else if (outcome.failure.has_value()) {
      report.failures.push_back(std::move(*outcome.failure));
    }
  }

  std::sort(report.ranked.begin(), report.ranked.end(),
            [](const domain::MatchResult& a, const domain::MatchResult& b) {
              if (a.overall_score != b.overall_score) {
                return a.overall_score > b.overall_score;
              }
              return a.candidate_id < b.candidate_id;
            });

  report.evaluated = report.ranked.size();
  if (options.top_k > 0 && report.ranked.size() > options.top_k) {
    report.ranked.resize(options.top_k);
  }

  spdlog::debug("batch match: job '{}' evaluated {} candidates, {} failures", report.job_id,
                report.evaluated, report.failures.size());
  return report;
}

}  // namespace fitscore::matching
