#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace grid {

class GridError : public std::runtime_error {
public:
    explicit GridError(const std::string& message)
        : std::runtime_error(message) {}
};

// Joins reasons as "a; b; c".
std::string join_reasons(const std::vector<std::string>& reasons);

class ConfigInvalid : public GridError {
public:
    explicit ConfigInvalid(std::vector<std::string> reasons)
        : GridError("invalid configuration: " + join_reasons(reasons)),
          reasons_(std::move(reasons)) {}

    [[nodiscard]] const std::vector<std::string>& reasons() const noexcept { return reasons_; }

private:
    std::vector<std::string> reasons_;
};

class InsufficientGridResolution : public GridError {
public:
    InsufficientGridResolution(double quantity, double min_qty)
        : GridError("per-level quantity " + std::to_string(quantity) +
                    " is below the exchange minimum " + std::to_string(min_qty)),
          quantity_(quantity),
          min_qty_(min_qty) {}

    [[nodiscard]] double quantity() const noexcept { return quantity_; }
    [[nodiscard]] double min_qty() const noexcept { return min_qty_; }

private:
    double quantity_;
    double min_qty_;
};

class RiskCheckFailed : public GridError {
public:
    explicit RiskCheckFailed(std::vector<std::string> reasons)
        : GridError("risk check failed: " + join_reasons(reasons)),
          reasons_(std::move(reasons)) {}

    [[nodiscard]] const std::vector<std::string>& reasons() const noexcept { return reasons_; }

private:
    std::vector<std::string> reasons_;
};

class PersistenceError : public GridError {
public:
    explicit PersistenceError(const std::string& message)
        : GridError(message) {}
};

} // namespace grid
