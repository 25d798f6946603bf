#pragma once

#include "config.hpp"
#include "simulator.hpp"
#include <optional>
#include <string>

namespace orb {

enum class Outcome { Win, Loss, NoTrade };

const char* toString(Outcome o);
/// Throws InputValidationError on anything but WIN / LOSS / NO_TRADE.
Outcome parseOutcome(const std::string& s);

struct Classification {
    Outcome outcome{Outcome::NoTrade};
    double r_multiple{0};  // net of costs
    double r_gross{0};
};

/// Cost of one round trip expressed in R for a trade risking risk_ticks.
/// Zero risk means zero cost (no division).
double costInR(const CostModel& cost, double risk_ticks);

/// Turns a resolved trade path into (outcome, R).
/// No trade or UNRESOLVED -> NO_TRADE with R 0. TARGET -> WIN +rr, STOP -> LOSS -1,
/// each less costInR when a cost model is given. Throws ComputationIntegrityError
/// on a non-finite intermediate.
Classification classifyOutcome(const std::optional<SimulatedTrade>& trade,
                               const std::optional<TradePath>& path,
                               double rr,
                               const std::optional<CostModel>& cost);

} // namespace orb
