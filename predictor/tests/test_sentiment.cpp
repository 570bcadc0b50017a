#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "../src/sentiment.hpp"

using Catch::Matchers::WithinAbs;

namespace {

AnalystOpinion opinion(const std::string& pick, std::optional<double> confidence) {
    AnalystOpinion op;
    op.pick = pick;
    op.confidence = confidence;
    return op;
}

TweetSentiment tweet(std::optional<double> score) {
    TweetSentiment t;
    t.sentiment_score = score;
    return t;
}

} // namespace

TEST_CASE("Sentiment feature extraction", "[sentiment]") {
    SECTION("Tweets and a single home pick") {
        SentimentPayload payload;
        payload.home_tweets = {tweet(0.8)};
        payload.away_tweets = {tweet(0.6)};
        payload.analyst_opinions = {opinion("home", 0.9)};
        
        auto features = SentimentFeatureExtractor::extract(payload);
        
        REQUIRE(features.home_sentiment_score == 0.8);
        REQUIRE(features.away_sentiment_score == 0.6);
        REQUIRE(features.analyst_confidence_home == 0.9);
        REQUIRE(features.analyst_confidence_away == 0.0);
    }
    
    SECTION("Empty payload is all zeros") {
        auto features = SentimentFeatureExtractor::extract(SentimentPayload());
        
        REQUIRE(features.home_sentiment_score == 0.0);
        REQUIRE(features.away_sentiment_score == 0.0);
        REQUIRE(features.analyst_confidence_home == 0.0);
        REQUIRE(features.analyst_confidence_away == 0.0);
    }
    
    SECTION("Tweet scores are averaged, missing scores count as zero") {
        SentimentPayload payload;
        payload.home_tweets = {tweet(0.5), tweet(-0.25), tweet(std::nullopt), tweet(1.0)};
        
        auto features = SentimentFeatureExtractor::extract(payload);
        
        REQUIRE_THAT(features.home_sentiment_score, WithinAbs(1.25 / 4.0, 1e-12));
        REQUIRE(features.away_sentiment_score == 0.0);
    }
    
    SECTION("Analyst confidence is summed per side") {
        SentimentPayload payload;
        payload.analyst_opinions = {
            opinion("home", 0.7),
            opinion("home", 0.6),
            opinion("away", 0.4),
            opinion("home", std::nullopt)
        };
        
        auto features = SentimentFeatureExtractor::extract(payload);
        
        REQUIRE_THAT(features.analyst_confidence_home, WithinAbs(1.3, 1e-12));
        REQUIRE_THAT(features.analyst_confidence_away, WithinAbs(0.4, 1e-12));
    }
    
    SECTION("Any pick other than home goes to away") {
        SentimentPayload payload;
        payload.analyst_opinions = {
            opinion("HOME", 0.5),
            opinion("", 0.25),
            opinion("draw", 0.125)
        };
        
        auto features = SentimentFeatureExtractor::extract(payload);
        
        REQUIRE(features.analyst_confidence_home == 0.0);
        REQUIRE_THAT(features.analyst_confidence_away, WithinAbs(0.875, 1e-12));
    }
}
