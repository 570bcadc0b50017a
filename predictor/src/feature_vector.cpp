#include "feature_vector.hpp"
#include "team_stats.hpp"
#include "sentiment.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

const FeatureSchema& canonical_schema() {
    static const FeatureSchema schema = {
        // Team performance
        "home_win_rate",
        "away_win_rate",
        "home_points_scored_avg",
        "away_points_scored_avg",
        "home_points_allowed_avg",
        "away_points_allowed_avg",
        // Advanced stats
        "home_yards_per_play",
        "away_yards_per_play",
        "home_turnover_diff",
        "away_turnover_diff",
        // Sentiment
        "home_sentiment_score",
        "away_sentiment_score",
        "analyst_confidence_home",
        "analyst_confidence_away",
        // Game context
        "is_division_game",
        "is_primetime",
        "home_rest_days",
        "away_rest_days",
    };
    return schema;
}

double FeatureVector::get(const std::string& name) const {
    const auto& schema = canonical_schema();
    auto it = std::find(schema.begin(), schema.end(), name);
    if (it == schema.end()) {
        throw std::out_of_range("Unknown feature: " + name);
    }
    return values_[static_cast<size_t>(it - schema.begin())];
}

nlohmann::json FeatureVector::to_json() const {
    // Keys are emitted as an ordered list of pairs so the order survives
    nlohmann::json out = nlohmann::json::array();
    const auto& schema = canonical_schema();
    for (size_t i = 0; i < kFeatureCount; ++i) {
        out.push_back({{"name", schema[i]}, {"value", values_[i]}});
    }
    return out;
}

FeatureVector FeatureVector::from_json(const nlohmann::json& named) {
    if (!named.is_object()) {
        throw DataContractError("Feature vector must be an object of name -> number");
    }
    
    Values values;
    const auto& schema = canonical_schema();
    for (size_t i = 0; i < kFeatureCount; ++i) {
        auto it = named.find(schema[i]);
        if (it == named.end()) {
            throw DataContractError("Missing feature: " + schema[i]);
        }
        if (it->is_boolean()) {
            values[i] = it->get<bool>() ? 1.0 : 0.0;
        } else if (it->is_number()) {
            values[i] = it->get<double>();
        } else {
            throw DataContractError("Feature " + schema[i] + " must be numeric");
        }
    }
    if (named.size() != kFeatureCount) {
        throw DataContractError("Unexpected extra features in input");
    }
    return FeatureVector(values);
}

void TrainingDataset::add(const FeatureVector& fv, int label) {
    if (label != 0 && label != 1) {
        throw std::invalid_argument("Label must be 0 or 1");
    }
    features.push_back(fv);
    labels.push_back(label);
}

FeatureVectorBuilder::FeatureVectorBuilder(int window_size) : window_size_(window_size) {
    if (window_size_ < 1) {
        throw std::invalid_argument("window_size must be >= 1");
    }
}

FeatureVector FeatureVectorBuilder::build(const GameRecord& game,
                                          const std::vector<GameRecord>& historical_games) const {
    return build_from(game, historical_games, historical_games.size());
}

FeatureVector FeatureVectorBuilder::build_from(const GameRecord& game,
                                               const std::vector<GameRecord>& games,
                                               size_t history_len) const {
    if (game.home.id.empty() || game.away.id.empty()) {
        throw DataContractError("Game is missing a team id");
    }
    
    TeamStats home = TeamStatsAggregator::compute_prefix(games, history_len, game.home.id, window_size_);
    TeamStats away = TeamStatsAggregator::compute_prefix(games, history_len, game.away.id, window_size_);
    SentimentFeatures sentiment = SentimentFeatureExtractor::extract(game.sentiment);
    
    // Must follow canonical_schema() exactly
    FeatureVector::Values v = {
        home.win_rate,
        away.win_rate,
        home.points_scored_avg,
        away.points_scored_avg,
        home.points_allowed_avg,
        away.points_allowed_avg,
        home.yards_per_game / kApproxPlaysPerGame,
        away.yards_per_game / kApproxPlaysPerGame,
        home.turnover_diff,
        away.turnover_diff,
        sentiment.home_sentiment_score,
        sentiment.away_sentiment_score,
        sentiment.analyst_confidence_home,
        sentiment.analyst_confidence_away,
        game.is_division_game ? 1.0 : 0.0,
        game.is_primetime ? 1.0 : 0.0,
        game.home_rest_days.value_or(kDefaultRestDays),
        game.away_rest_days.value_or(kDefaultRestDays),
    };
    
    return FeatureVector(v);
}

// Unlike the Python service, which used the whole list as history for every
// row, row i only sees games [0, i).
TrainingDataset FeatureVectorBuilder::build_training_dataset(
    const std::vector<GameRecord>& games) const {
    TrainingDataset dataset;
    size_t unlabelled = 0;
    
    for (size_t i = 0; i < games.size(); ++i) {
        if (games[i].winner == Winner::Unknown) {
            unlabelled++;
        }
        dataset.add(build_from(games[i], games, i), games[i].winner == Winner::Home ? 1 : 0);
    }
    
    if (unlabelled > 0) {
        spdlog::warn("{} of {} training games have winner '{}', labelled as away wins",
                     unlabelled, games.size(), winner_string(Winner::Unknown));
    }
    
    return dataset;
}
