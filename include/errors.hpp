#pragma once

#include <stdexcept>
#include <string>

namespace orb {

/// Bars for a day could not be read. The day is skipped; the run continues.
class DataGapError : public std::runtime_error {
public:
    explicit DataGapError(const std::string& what) : std::runtime_error(what) {}
};

/// Malformed input or configuration. Aborts the unit being computed
/// (the whole run when raised during start-up validation).
class InputValidationError : public std::runtime_error {
public:
    explicit InputValidationError(const std::string& what) : std::runtime_error(what) {}
};

/// A result that can only come from a logic defect (NaN R, high < low,
/// breakout outside the post-window span). Halts the run before anything
/// for the offending day is persisted.
class ComputationIntegrityError : public std::runtime_error {
public:
    explicit ComputationIntegrityError(const std::string& what,
                                       const std::string& day = "",
                                       const std::string& window = "",
                                       const std::string& direction = "")
        : std::runtime_error(what), day_(day), window_(window), direction_(direction) {}

    const std::string& day() const { return day_; }
    const std::string& window() const { return window_; }
    const std::string& direction() const { return direction_; }

    /// "day=2025-01-10 window=1000 direction=UP: <what>"
    std::string describe() const {
        return "day=" + (day_.empty() ? "?" : day_)
            + " window=" + (window_.empty() ? "?" : window_)
            + " direction=" + (direction_.empty() ? "?" : direction_)
            + ": " + what();
    }

private:
    std::string day_;
    std::string window_;
    std::string direction_;
};

/// Feature table write failed; the affected range keeps its prior content.
class PersistenceError : public std::runtime_error {
public:
    explicit PersistenceError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace orb
