#pragma once

#include <stdexcept>
#include <string>

class PredictorError : public std::runtime_error {
public:
    explicit PredictorError(const std::string& what) : std::runtime_error(what) {}
};

// Upstream record violates the expected shape (missing ids, bad dates, wrong types)
class DataContractError : public PredictorError {
public:
    explicit DataContractError(const std::string& what) : PredictorError(what) {}
};

class TrainingError : public PredictorError {
public:
    explicit TrainingError(const std::string& what) : PredictorError(what) {}
};

// Empty dataset or a label set that cannot produce a two-class split
class InsufficientDataError : public TrainingError {
public:
    explicit InsufficientDataError(const std::string& what) : TrainingError(what) {}
};

class TrainingCancelled : public TrainingError {
public:
    TrainingCancelled() : TrainingError("Training cancelled") {}
};

// Worker already holds a pending or running job
class JobConflictError : public TrainingError {
public:
    explicit JobConflictError(const std::string& what) : TrainingError(what) {}
};

class NotReadyError : public PredictorError {
public:
    explicit NotReadyError(const std::string& what) : PredictorError(what) {}
};

class StoreError : public PredictorError {
public:
    explicit StoreError(const std::string& what) : PredictorError(what) {}
};
