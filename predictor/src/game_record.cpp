#include "game_record.hpp"
#include "errors.hpp"
#include "util.hpp"

namespace {

using nlohmann::json;

std::optional<double> optional_number(const json& obj, const char* key, const std::string& where) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return std::nullopt;
    if (!it->is_number()) {
        throw DataContractError(where + "." + key + " must be a number");
    }
    return it->get<double>();
}

bool optional_bool(const json& obj, const char* key, const std::string& where) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return false;
    if (it->is_boolean()) return it->get<bool>();
    // Upstream collectors sometimes send 0/1
    if (it->is_number_integer()) return it->get<int64_t>() != 0;
    throw DataContractError(where + "." + key + " must be a boolean");
}

const json* optional_object(const json& obj, const char* key, const std::string& where) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return nullptr;
    if (!it->is_object()) {
        throw DataContractError(where + "." + key + " must be an object");
    }
    return &(*it);
}

const json* optional_array(const json& obj, const char* key, const std::string& where) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return nullptr;
    if (!it->is_array()) {
        throw DataContractError(where + "." + key + " must be an array");
    }
    return &(*it);
}

std::vector<TweetSentiment> parse_tweets(const json* list, const std::string& where) {
    std::vector<TweetSentiment> tweets;
    if (!list) return tweets;
    
    tweets.reserve(list->size());
    for (const auto& item : *list) {
        if (!item.is_object()) {
            throw DataContractError(where + " entries must be objects");
        }
        TweetSentiment t;
        t.sentiment_score = optional_number(item, "sentiment_score", where);
        tweets.push_back(t);
    }
    return tweets;
}

} // namespace

std::string winner_string(Winner w) {
    switch (w) {
        case Winner::Home: return "home";
        case Winner::Away: return "away";
        default: return "unknown";
    }
}

TeamRef RecordParser::parse_team(const json& raw, const char* side) {
    auto it = raw.find(side);
    if (it == raw.end() || !it->is_object()) {
        throw DataContractError(std::string("Missing ") + side + " object");
    }
    
    auto id_it = it->find("id");
    if (id_it == it->end() || !id_it->is_string() || id_it->get<std::string>().empty()) {
        throw DataContractError(std::string("Missing ") + side + ".id");
    }
    
    TeamRef team;
    team.id = id_it->get<std::string>();
    auto name_it = it->find("name");
    if (name_it != it->end() && name_it->is_string()) {
        team.name = name_it->get<std::string>();
    }
    team.score = optional_number(*it, "score", side);
    return team;
}

SentimentPayload RecordParser::parse_sentiment(const json& raw) {
    SentimentPayload payload;
    if (raw.is_null()) return payload;
    if (!raw.is_object()) {
        throw DataContractError("sentiment_data must be an object");
    }
    
    if (const json* tweets = optional_object(raw, "tweets", "sentiment_data")) {
        payload.home_tweets = parse_tweets(
            optional_array(*tweets, "home_team", "tweets"), "tweets.home_team");
        payload.away_tweets = parse_tweets(
            optional_array(*tweets, "away_team", "tweets"), "tweets.away_team");
    }
    
    if (const json* opinions = optional_array(raw, "analyst_opinions", "sentiment_data")) {
        for (const auto& item : *opinions) {
            if (!item.is_object()) {
                throw DataContractError("analyst_opinions entries must be objects");
            }
            AnalystOpinion op;
            auto pick_it = item.find("pick");
            if (pick_it != item.end() && pick_it->is_string()) {
                op.pick = pick_it->get<std::string>();
            }
            op.confidence = optional_number(item, "confidence", "analyst_opinions");
            payload.analyst_opinions.push_back(op);
        }
    }
    
    return payload;
}

GameRecord RecordParser::parse_game(const json& raw) {
    if (!raw.is_object()) {
        throw DataContractError("Game record must be an object");
    }
    
    GameRecord game;
    game.home = parse_team(raw, "homeTeam");
    game.away = parse_team(raw, "awayTeam");
    
    auto winner_it = raw.find("winner");
    if (winner_it != raw.end() && winner_it->is_string()) {
        const auto& w = winner_it->get_ref<const std::string&>();
        if (w == "home") game.winner = Winner::Home;
        else if (w == "away") game.winner = Winner::Away;
    }
    
    auto date_it = raw.find("date");
    if (date_it != raw.end() && !date_it->is_null()) {
        if (!date_it->is_string() || !util::is_valid_date(date_it->get<std::string>())) {
            throw DataContractError("date must be YYYY-MM-DD");
        }
        game.date = date_it->get<std::string>();
    }
    
    if (const json* stats = optional_object(raw, "stats", "game")) {
        game.stats.home_yards_total = optional_number(*stats, "home_yards_total", "stats");
        game.stats.away_yards_total = optional_number(*stats, "away_yards_total", "stats");
        game.stats.home_turnovers = optional_number(*stats, "home_turnovers", "stats");
        game.stats.away_turnovers = optional_number(*stats, "away_turnovers", "stats");
    }
    
    game.is_primetime = optional_bool(raw, "is_primetime", "game");
    game.is_division_game = optional_bool(raw, "is_division_game", "game");
    game.home_rest_days = optional_number(raw, "home_rest_days", "game");
    game.away_rest_days = optional_number(raw, "away_rest_days", "game");
    
    auto sentiment_it = raw.find("sentiment_data");
    if (sentiment_it != raw.end()) {
        game.sentiment = parse_sentiment(*sentiment_it);
    }
    
    return game;
}

std::vector<GameRecord> RecordParser::parse_games(const json& raw) {
    if (!raw.is_array()) {
        throw DataContractError("Expected an array of game records");
    }
    
    std::vector<GameRecord> games;
    games.reserve(raw.size());
    for (size_t i = 0; i < raw.size(); ++i) {
        try {
            games.push_back(parse_game(raw[i]));
        } catch (const DataContractError& e) {
            throw DataContractError("Game record " + std::to_string(i) + ": " + e.what());
        }
    }
    return games;
}
