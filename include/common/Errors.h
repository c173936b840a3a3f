#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace harvestcast {

class ForecastError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Series is below the minimum sample size of the requested operation
class InsufficientDataError : public ForecastError {
public:
    InsufficientDataError(const std::string& key, std::size_t got, std::size_t required)
        : ForecastError("insufficient data for " + key + ": need >= " +
                        std::to_string(required) + " points, got " + std::to_string(got))
        , key_(key), got_(got), required_(required) {}

    const std::string& key() const { return key_; }
    std::size_t got() const { return got_; }
    std::size_t required() const { return required_; }

private:
    std::string key_;
    std::size_t got_;
    std::size_t required_;
};

// predict() before any successful train() for the key
class ModelUnavailableError : public ForecastError {
public:
    explicit ModelUnavailableError(const std::string& key)
        : ForecastError("no trained model for " + key), key_(key) {}

    const std::string& key() const { return key_; }

private:
    std::string key_;
};

} // namespace harvestcast
