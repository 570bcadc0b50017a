#pragma once

#include "game_record.hpp"
#include <string>
#include <vector>

struct TeamStats {
    double win_rate = 0.0;
    double points_scored_avg = 0.0;
    double points_allowed_avg = 0.0;
    double yards_per_game = 0.0;
    double turnover_diff = 0.0;
};

// One game seen from a single team's side
struct TeamGameView {
    bool is_home;
    double points_scored;
    double points_allowed;
    double yards;
    double turnovers;
    bool won;
};

class TeamStatsAggregator {
public:
    static constexpr int kDefaultWindow = 5;
    
    // Rolling stats over the last window_size games involving team_id.
    // Games must already be in chronological order. No matches -> all zeros.
    static TeamStats compute(const std::vector<GameRecord>& historical_games,
                             const std::string& team_id,
                             int window_size = kDefaultWindow);
    
    // Same, restricted to the first history_len records
    static TeamStats compute_prefix(const std::vector<GameRecord>& games,
                                    size_t history_len,
                                    const std::string& team_id,
                                    int window_size = kDefaultWindow);
    
    static std::vector<TeamGameView> team_games(const std::vector<GameRecord>& games,
                                                size_t history_len,
                                                const std::string& team_id);
};
