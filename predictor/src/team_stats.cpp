#include "team_stats.hpp"
#include "errors.hpp"
#include <algorithm>
#include <stdexcept>

std::vector<TeamGameView> TeamStatsAggregator::team_games(
    const std::vector<GameRecord>& games, size_t history_len, const std::string& team_id) {
    std::vector<TeamGameView> views;
    size_t end = std::min(history_len, games.size());
    
    for (size_t i = 0; i < end; ++i) {
        const auto& game = games[i];
        if (game.home.id.empty() || game.away.id.empty()) {
            throw DataContractError("Historical game is missing a team id");
        }
        
        if (game.home.id == team_id) {
            views.push_back({
                true,
                game.home.score.value_or(0.0),
                game.away.score.value_or(0.0),
                game.stats.home_yards_total.value_or(0.0),
                game.stats.home_turnovers.value_or(0.0),
                game.winner == Winner::Home
            });
        } else if (game.away.id == team_id) {
            views.push_back({
                false,
                game.away.score.value_or(0.0),
                game.home.score.value_or(0.0),
                game.stats.away_yards_total.value_or(0.0),
                game.stats.away_turnovers.value_or(0.0),
                game.winner == Winner::Away
            });
        }
    }
    
    return views;
}

TeamStats TeamStatsAggregator::compute(const std::vector<GameRecord>& historical_games,
                                       const std::string& team_id,
                                       int window_size) {
    return compute_prefix(historical_games, historical_games.size(), team_id, window_size);
}

TeamStats TeamStatsAggregator::compute_prefix(const std::vector<GameRecord>& games,
                                              size_t history_len,
                                              const std::string& team_id,
                                              int window_size) {
    if (team_id.empty()) {
        throw DataContractError("Team id is required");
    }
    if (window_size < 1) {
        throw std::invalid_argument("window_size must be >= 1");
    }
    
    auto views = team_games(games, history_len, team_id);
    
    TeamStats stats;
    if (views.empty()) {
        return stats;
    }
    
    // Last N in the caller's order, no re-sorting
    size_t start = views.size() > static_cast<size_t>(window_size)
        ? views.size() - static_cast<size_t>(window_size) : 0;
    double n = static_cast<double>(views.size() - start);
    
    for (size_t i = start; i < views.size(); ++i) {
        const auto& v = views[i];
        stats.win_rate += v.won ? 1.0 : 0.0;
        stats.points_scored_avg += v.points_scored;
        stats.points_allowed_avg += v.points_allowed;
        stats.yards_per_game += v.yards;
        stats.turnover_diff += v.turnovers;
    }
    
    stats.win_rate /= n;
    stats.points_scored_avg /= n;
    stats.points_allowed_avg /= n;
    stats.yards_per_game /= n;
    stats.turnover_diff /= n;
    
    return stats;
}
