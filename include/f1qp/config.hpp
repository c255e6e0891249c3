#pragma once
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <f1qp/session.hpp>

namespace f1qp {

enum class ScoringKind { SimpleWeighted, ZScoreNormalized, PriorOnly };
enum class RegulationState { Stable, Reset };

struct TierPrior {
  double mean = 0.0;
  double variance = 1.0;
};

// Standings -> prior transform.
//   mean     = max(min_mean, top_mean - rank_step * (rank - 1))
//   variance = established_variance + inexperience_variance / (1 + seasons)
// Rookies copy their team's tier prior with variance * rookie_multiplier.
struct PriorConfig {
  double top_mean = 20.0;
  double rank_step = 1.0;
  double min_mean = 1.0;
  double established_variance = 9.0;
  double inexperience_variance = 16.0;
  double rookie_multiplier = 1.5;
  std::map<std::string, TierPrior> tiers{
    {"top",        {17.0, 16.0}},
    {"midfield",   {12.0, 25.0}},
    {"backmarker", { 8.0, 36.0}},
  };
};

struct ScoringConfig {
  // Weight per metric category ("corner_slow.min_speed" -> "corner_slow").
  std::map<std::string, double> weights{
    {"corner_slow",   0.2},
    {"corner_medium", 0.4},
    {"corner_high",   0.2},
    {"straight",      0.2},
  };
  // pace = offset + scale * weighted sum. With the default weights and speeds
  // in km/h a typical car sums to about 188, which lands at 10.5.
  double simple_offset = -365.5;
  double simple_scale = 2.0;
  double zscore_center = 10.5; // pace = center + spread * weighted z-sum
  double zscore_spread = 4.0;
  double outlier_mad = 0.0;    // <= 0 disables MAD outlier removal
};

// Explicit tuning state handed to every stage; there is no global copy.
struct ModelConfig {
  ScoringKind scoring_method = ScoringKind::ZScoreNormalized;
  RegulationState regulation_state = RegulationState::Stable;
  int min_clean_laps = 3;
  double variance_floor = 1e-6;
  double evidence_variance = 4.0;

  std::map<SessionType, double> trust_weights{
    {SessionType::Testing,          0.1},
    {SessionType::Practice1,        0.3},
    {SessionType::Practice2,        0.3},
    {SessionType::Practice3,        0.3},
    {SessionType::SprintQualifying, 0.8},
  };
  double regulation_scale_stable = 1.0;
  double regulation_scale_reset = 1.5;
  double trust_scale = 1.0; // global multiplier, set by validation fitting

  ScoringConfig scoring;
  PriorConfig prior;

  int min_history_events = 1;
  bool fit_trust_scale = true;
  std::vector<double> trust_scale_grid{0.25, 0.5, 1.0, 1.5, 2.0};
  unsigned threads = 0; // 0 = hardware concurrency
};

const char* scoring_kind_name(ScoringKind k);
std::optional<ScoringKind> parse_scoring_kind(const std::string& s);
const char* regulation_state_name(RegulationState s);
std::optional<RegulationState> parse_regulation_state(const std::string& s);

double regulation_scale(const ModelConfig& cfg);

// Effective lambda in [0,1] for a session type; 0 for types with no table entry.
double trust_weight(const ModelConfig& cfg, SessionType type);

// Applies one key/value pair; false if the key is unknown or the value invalid
// (cfg is left unchanged in that case).
bool apply_config_entry(ModelConfig& cfg, const std::string& key, const std::string& value);

// "key,value" rows on top of the defaults. Optional "key,value" header,
// '#' comments and blank lines ignored; bad rows are logged and skipped.
ModelConfig model_config_from_csv_stream(std::istream& in);

// Filesystem wrapper; returns nullopt if file cannot be opened.
std::optional<ModelConfig> load_model_config_csv(const std::string& path);

} // namespace f1qp
