#pragma once

#include "game_record.hpp"

struct SentimentFeatures {
    double home_sentiment_score = 0.0;
    double away_sentiment_score = 0.0;
    double analyst_confidence_home = 0.0;
    double analyst_confidence_away = 0.0;
};

class SentimentFeatureExtractor {
public:
    // Tweet scores are averaged per side; analyst confidence is summed per pick.
    static SentimentFeatures extract(const SentimentPayload& payload);
    
private:
    static double mean_score(const std::vector<TweetSentiment>& tweets);
};
