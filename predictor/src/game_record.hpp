#pragma once

#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

enum class Winner {
    Home,
    Away,
    Unknown
};

struct TeamRef {
    std::string id;                 // required
    std::string name;
    std::optional<double> score;
};

struct GameStats {
    std::optional<double> home_yards_total;
    std::optional<double> away_yards_total;
    std::optional<double> home_turnovers;
    std::optional<double> away_turnovers;
};

struct TweetSentiment {
    std::optional<double> sentiment_score;
};

struct AnalystOpinion {
    std::string pick;               // "home" or anything else (counted as away)
    std::optional<double> confidence;
};

struct SentimentPayload {
    std::vector<TweetSentiment> home_tweets;
    std::vector<TweetSentiment> away_tweets;
    std::vector<AnalystOpinion> analyst_opinions;
};

struct GameRecord {
    TeamRef home;
    TeamRef away;
    Winner winner = Winner::Unknown;
    std::optional<std::string> date;    // YYYY-MM-DD
    GameStats stats;
    bool is_primetime = false;
    bool is_division_game = false;
    std::optional<double> home_rest_days;
    std::optional<double> away_rest_days;
    SentimentPayload sentiment;
};

std::string winner_string(Winner w);

// Structural validation boundary for upstream JSON. Throws DataContractError.
class RecordParser {
public:
    static GameRecord parse_game(const nlohmann::json& raw);
    static std::vector<GameRecord> parse_games(const nlohmann::json& raw);
    static SentimentPayload parse_sentiment(const nlohmann::json& raw);
    
private:
    static TeamRef parse_team(const nlohmann::json& raw, const char* side);
};
