#include "match_logic.h"

using json = nlohmann::json;

json aggregate_to_json(const dcm::matching::AggregateMatch& aggregate) {
  json outcomes = json::object();
  for (const auto& [name, outcome] : aggregate.outcomes) {
    json o;
    o["matched"] = outcome.matched.has_value() ? json(*outcome.matched) : json(nullptr);
    o["score"] = outcome.score;
    o["confidence"] = outcome.confidence;
    o["best_score"] = outcome.best_score;
    o["strategy"] = dcm::matching::to_string(outcome.strategy_used);
    if (outcome.span.has_value()) {
      o["span"] = {{"start", outcome.span->start}, {"length", outcome.span->length}};
    } else {
      o["span"] = nullptr;
    }
    outcomes[name] = std::move(o);
  }

  json out;
  out["input"] = aggregate.input;
  out["overall_score"] = aggregate.overall_score;
  out["complete"] = aggregate.is_complete();
  out["unmatched_required"] = aggregate.unmatched_required;
  out["outcomes"] = std::move(outcomes);
  return out;
}

json run_multi_match(const std::vector<dcm::matching::TargetConfig>& targets,
                     const std::vector<std::string>& inputs, double min_score) {
  const dcm::matching::MultiTargetMatcher matcher(targets);

  json results = json::array();
  for (const auto& aggregate : matcher.match_all(inputs)) {
    results.push_back(aggregate_to_json(aggregate));
  }

  json ranking = json::array();
  for (const auto& aggregate : matcher.best_matches(inputs, min_score)) {
    ranking.push_back({{"input", aggregate.input}, {"overall_score", aggregate.overall_score}});
  }

  json out;
  out["results"] = std::move(results);
  out["ranking"] = std::move(ranking);
  return out;
}
