#include <f1qp/config.hpp>
#include <f1qp/csv.hpp>
#include <f1qp/logging.hpp>
#include <algorithm>
#include <fstream>

namespace f1qp {

static inline double clamp01(double x) {
  return x < 0.0 ? 0.0 : (x > 1.0 ? 1.0 : x);
}

const char* scoring_kind_name(ScoringKind k) {
  switch (k) {
    case ScoringKind::SimpleWeighted:   return "simple_weighted";
    case ScoringKind::ZScoreNormalized: return "zscore_normalized";
    case ScoringKind::PriorOnly:        return "prior_only";
  }
  return "unknown";
}

std::optional<ScoringKind> parse_scoring_kind(const std::string& s) {
  const auto v = lower(trim(s));
  if (v == "simple_weighted")   return ScoringKind::SimpleWeighted;
  if (v == "zscore_normalized") return ScoringKind::ZScoreNormalized;
  if (v == "prior_only")        return ScoringKind::PriorOnly;
  return std::nullopt;
}

const char* regulation_state_name(RegulationState s) {
  return s == RegulationState::Reset ? "reset" : "stable";
}

std::optional<RegulationState> parse_regulation_state(const std::string& s) {
  const auto v = lower(trim(s));
  if (v == "stable") return RegulationState::Stable;
  if (v == "reset")  return RegulationState::Reset;
  return std::nullopt;
}

double regulation_scale(const ModelConfig& cfg) {
  return cfg.regulation_state == RegulationState::Reset ? cfg.regulation_scale_reset
                                                        : cfg.regulation_scale_stable;
}

double trust_weight(const ModelConfig& cfg, SessionType type) {
  auto it = cfg.trust_weights.find(type);
  if (it == cfg.trust_weights.end()) return 0.0;
  return clamp01(it->second * regulation_scale(cfg) * cfg.trust_scale);
}

static std::optional<std::vector<double>> parse_double_list(const std::string& s) {
  std::vector<double> out;
  for (const auto& item : split_csv_line(s, ';')) {
    auto v = parse_double(item);
    if (!v) return std::nullopt;
    out.push_back(*v);
  }
  if (out.empty()) return std::nullopt;
  return out;
}

// Splits "prefix.rest" -> rest when key starts with prefix + '.'.
static std::optional<std::string> suffix_after(const std::string& key, const std::string& prefix) {
  if (key.size() <= prefix.size() + 1) return std::nullopt;
  if (key.compare(0, prefix.size(), prefix) != 0 || key[prefix.size()] != '.') return std::nullopt;
  return key.substr(prefix.size() + 1);
}

static bool set_positive(double& slot, const std::string& value) {
  auto v = parse_double(value);
  if (!v || *v <= 0.0) return false;
  slot = *v;
  return true;
}

static bool set_non_negative(double& slot, const std::string& value) {
  auto v = parse_double(value);
  if (!v || *v < 0.0) return false;
  slot = *v;
  return true;
}

static bool set_double(double& slot, const std::string& value) {
  auto v = parse_double(value);
  if (!v) return false;
  slot = *v;
  return true;
}

bool apply_config_entry(ModelConfig& cfg, const std::string& raw_key, const std::string& value) {
  const std::string key = lower(trim(raw_key));

  if (key == "scoring_method") {
    auto k = parse_scoring_kind(value);
    if (!k) return false;
    cfg.scoring_method = *k;
    return true;
  }
  if (key == "regulation_state") {
    auto s = parse_regulation_state(value);
    if (!s) return false;
    cfg.regulation_state = *s;
    return true;
  }
  if (key == "min_clean_laps") {
    auto v = parse_int(value);
    if (!v || *v < 0) return false;
    cfg.min_clean_laps = *v;
    return true;
  }
  if (key == "variance_floor")    return set_positive(cfg.variance_floor, value);
  if (key == "evidence_variance") return set_positive(cfg.evidence_variance, value);
  if (key == "outlier_mad")       return set_non_negative(cfg.scoring.outlier_mad, value);
  if (key == "min_history_events") {
    auto v = parse_int(value);
    if (!v || *v < 1) return false;
    cfg.min_history_events = *v;
    return true;
  }
  if (key == "fit_trust_scale") {
    auto b = parse_bool(value);
    if (!b) return false;
    cfg.fit_trust_scale = *b;
    return true;
  }
  if (key == "trust_scale_grid") {
    auto grid = parse_double_list(value);
    if (!grid) return false;
    if (std::any_of(grid->begin(), grid->end(), [](double g){ return g < 0.0; })) return false;
    cfg.trust_scale_grid = *grid;
    return true;
  }
  if (key == "threads") {
    auto v = parse_int(value);
    if (!v || *v < 0) return false;
    cfg.threads = static_cast<unsigned>(*v);
    return true;
  }

  if (auto s = suffix_after(key, "trust")) {
    auto type = session_type_from_key(*s);
    auto v = parse_double(value);
    if (!type || !v || *v < 0.0 || *v > 1.0) return false;
    cfg.trust_weights[*type] = *v;
    return true;
  }
  if (auto s = suffix_after(key, "regulation_scale")) {
    if (*s == "stable") return set_non_negative(cfg.regulation_scale_stable, value);
    if (*s == "reset")  return set_non_negative(cfg.regulation_scale_reset, value);
    return false;
  }
  if (auto s = suffix_after(key, "weight")) {
    auto v = parse_double(value);
    if (!v) return false;
    cfg.scoring.weights[*s] = *v;
    return true;
  }
  if (auto s = suffix_after(key, "simple")) {
    if (*s == "offset") return set_double(cfg.scoring.simple_offset, value);
    if (*s == "scale")  return set_double(cfg.scoring.simple_scale, value);
    return false;
  }
  if (auto s = suffix_after(key, "zscore")) {
    if (*s == "center") return set_double(cfg.scoring.zscore_center, value);
    if (*s == "spread") return set_double(cfg.scoring.zscore_spread, value);
    return false;
  }
  if (auto s = suffix_after(key, "prior")) {
    auto& p = cfg.prior;
    if (*s == "top_mean")              return set_double(p.top_mean, value);
    if (*s == "rank_step")             return set_non_negative(p.rank_step, value);
    if (*s == "min_mean")              return set_double(p.min_mean, value);
    if (*s == "established_variance")  return set_positive(p.established_variance, value);
    if (*s == "inexperience_variance") return set_non_negative(p.inexperience_variance, value);
    if (*s == "rookie_multiplier") {
      auto v = parse_double(value);
      if (!v || *v < 1.0) return false;
      p.rookie_multiplier = *v;
      return true;
    }
    return false;
  }
  if (auto s = suffix_after(key, "tier")) {
    // tier.<label>.mean | tier.<label>.variance
    const auto dot = s->rfind('.');
    if (dot == std::string::npos || dot == 0) return false;
    const std::string label = s->substr(0, dot);
    const std::string field = s->substr(dot + 1);
    auto v = parse_double(value);
    if (!v) return false;
    TierPrior tier;
    if (auto it = cfg.prior.tiers.find(label); it != cfg.prior.tiers.end()) tier = it->second;
    if (field == "mean") tier.mean = *v;
    else if (field == "variance" && *v > 0.0) tier.variance = *v;
    else return false;
    cfg.prior.tiers[label] = tier;
    return true;
  }
  return false;
}

ModelConfig model_config_from_csv_stream(std::istream& in) {
  ModelConfig cfg;
  bool first = true;
  for (const auto& cols : read_csv_rows(in)) {
    if (first) {
      first = false;
      if (is_header_row(cols, "key")) continue;
    }
    if (cols.size() < 2 || cols[0].empty()) {
      F1QP_LOG_WARN("config: skipping malformed row '%s'", cols.empty() ? "" : cols[0].c_str());
      continue;
    }
    if (!apply_config_entry(cfg, cols[0], cols[1])) {
      F1QP_LOG_WARN("config: ignoring %s=%s (unknown key or invalid value)",
                    cols[0].c_str(), cols[1].c_str());
    }
  }
  return cfg;
}

std::optional<ModelConfig> load_model_config_csv(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return model_config_from_csv_stream(f);
}

} // namespace f1qp
