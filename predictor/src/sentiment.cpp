#include "sentiment.hpp"

double SentimentFeatureExtractor::mean_score(const std::vector<TweetSentiment>& tweets) {
    if (tweets.empty()) return 0.0;
    
    double sum = 0.0;
    for (const auto& t : tweets) {
        sum += t.sentiment_score.value_or(0.0);
    }
    return sum / static_cast<double>(tweets.size());
}

SentimentFeatures SentimentFeatureExtractor::extract(const SentimentPayload& payload) {
    SentimentFeatures features;
    
    features.home_sentiment_score = mean_score(payload.home_tweets);
    features.away_sentiment_score = mean_score(payload.away_tweets);
    
    // Anything not explicitly picking home counts toward away
    for (const auto& opinion : payload.analyst_opinions) {
        double confidence = opinion.confidence.value_or(0.0);
        if (opinion.pick == "home") {
            features.analyst_confidence_home += confidence;
        } else {
            features.analyst_confidence_away += confidence;
        }
    }
    
    return features;
}
