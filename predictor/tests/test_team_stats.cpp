#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "../src/team_stats.hpp"
#include "../src/errors.hpp"
#include "test_helpers.hpp"

using Catch::Matchers::WithinAbs;
using test_helpers::make_game;

TEST_CASE("Team stats aggregation", "[team_stats]") {
    SECTION("Single home win") {
        auto game = make_game("home-1", "away-1", 24, 17);
        game.stats.home_yards_total = 350;
        game.stats.home_turnovers = 1;
        
        auto stats = TeamStatsAggregator::compute({game}, "home-1", 5);
        
        REQUIRE(stats.win_rate == 1.0);
        REQUIRE(stats.points_scored_avg == 24.0);
        REQUIRE(stats.points_allowed_avg == 17.0);
        REQUIRE(stats.yards_per_game == 350.0);
        REQUIRE(stats.turnover_diff == 1.0);
    }
    
    SECTION("Away side view") {
        auto game = make_game("home-1", "away-1", 24, 17);
        game.stats.away_yards_total = 300;
        game.stats.away_turnovers = 2;
        
        auto stats = TeamStatsAggregator::compute({game}, "away-1");
        
        REQUIRE(stats.win_rate == 0.0);
        REQUIRE(stats.points_scored_avg == 17.0);
        REQUIRE(stats.points_allowed_avg == 24.0);
        REQUIRE(stats.yards_per_game == 300.0);
        REQUIRE(stats.turnover_diff == 2.0);
    }
    
    SECTION("No matching games gives zeros for any window") {
        std::vector<GameRecord> games = {
            make_game("a", "b", 10, 3),
            make_game("c", "a", 7, 14)
        };
        
        for (int window = 1; window <= 10; ++window) {
            auto stats = TeamStatsAggregator::compute(games, "zzz", window);
            REQUIRE(stats.win_rate == 0.0);
            REQUIRE(stats.points_scored_avg == 0.0);
            REQUIRE(stats.points_allowed_avg == 0.0);
            REQUIRE(stats.yards_per_game == 0.0);
            REQUIRE(stats.turnover_diff == 0.0);
        }
        
        auto empty = TeamStatsAggregator::compute({}, "a", 5);
        REQUIRE(empty.win_rate == 0.0);
    }
    
    SECTION("Window keeps the last games in caller order") {
        // Team "a": win, loss, win, loss, loss, win
        std::vector<GameRecord> games = {
            make_game("a", "b", 30, 0),
            make_game("a", "c", 0, 30),
            make_game("d", "a", 10, 20),
            make_game("a", "e", 3, 6),
            make_game("f", "a", 21, 14),
            make_game("a", "g", 40, 10)
        };
        
        auto last3 = TeamStatsAggregator::compute(games, "a", 3);
        // loss (3-6), loss (14-21), win (40-10)
        REQUIRE_THAT(last3.win_rate, WithinAbs(1.0 / 3.0, 1e-12));
        REQUIRE_THAT(last3.points_scored_avg, WithinAbs((3.0 + 14.0 + 40.0) / 3.0, 1e-12));
        REQUIRE_THAT(last3.points_allowed_avg, WithinAbs((6.0 + 21.0 + 10.0) / 3.0, 1e-12));
        
        auto all = TeamStatsAggregator::compute(games, "a", 100);
        REQUIRE_THAT(all.win_rate, WithinAbs(0.5, 1e-12));
    }
    
    SECTION("Win rate is the fraction of wins in the window") {
        std::vector<GameRecord> games;
        for (int i = 0; i < 8; ++i) {
            games.push_back(make_game("t", "o", i % 4 == 0 ? 10 : 0, 5));
        }
        
        for (int window = 1; window <= 8; ++window) {
            auto stats = TeamStatsAggregator::compute(games, "t", window);
            int wins = 0;
            for (int i = 8 - window; i < 8; ++i) {
                if (i % 4 == 0) wins++;
            }
            REQUIRE(stats.win_rate >= 0.0);
            REQUIRE(stats.win_rate <= 1.0);
            REQUIRE_THAT(stats.win_rate, WithinAbs(static_cast<double>(wins) / window, 1e-12));
        }
    }
    
    SECTION("Missing optional numbers count as zero") {
        GameRecord game;
        game.home.id = "a";
        game.away.id = "b";
        game.winner = Winner::Unknown;
        
        auto stats = TeamStatsAggregator::compute({game, make_game("a", "b", 20, 10)}, "a", 5);
        
        REQUIRE(stats.win_rate == 0.5);
        REQUIRE(stats.points_scored_avg == 10.0);
        REQUIRE(stats.points_allowed_avg == 5.0);
        REQUIRE(stats.yards_per_game == 0.0);
    }
    
    SECTION("Prefix restricts the history") {
        std::vector<GameRecord> games = {
            make_game("a", "b", 10, 0),
            make_game("a", "b", 0, 10)
        };
        
        auto first_only = TeamStatsAggregator::compute_prefix(games, 1, "a", 5);
        REQUIRE(first_only.win_rate == 1.0);
        
        auto none = TeamStatsAggregator::compute_prefix(games, 0, "a", 5);
        REQUIRE(none.points_scored_avg == 0.0);
    }
}

TEST_CASE("Team stats contract violations", "[team_stats]") {
    SECTION("Empty team id") {
        REQUIRE_THROWS_AS(TeamStatsAggregator::compute({}, "", 5), DataContractError);
    }
    
    SECTION("Historical game without ids") {
        GameRecord broken;
        broken.home.id = "a";
        REQUIRE_THROWS_AS(TeamStatsAggregator::compute({broken}, "a", 5), DataContractError);
    }
    
    SECTION("Window must be positive") {
        REQUIRE_THROWS_AS(TeamStatsAggregator::compute({}, "a", 0), std::invalid_argument);
    }
}
