#include "outcome.hpp"
#include "errors.hpp"
#include <cctype>
#include <cmath>

namespace orb {

const char* toString(Outcome o) {
    switch (o) {
        case Outcome::Win: return "WIN";
        case Outcome::Loss: return "LOSS";
        case Outcome::NoTrade: return "NO_TRADE";
    }
    return "NO_TRADE";
}

Outcome parseOutcome(const std::string& s) {
    std::string u = s;
    for (auto& c : u) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    if (u == "WIN") return Outcome::Win;
    if (u == "LOSS") return Outcome::Loss;
    if (u == "NO_TRADE") return Outcome::NoTrade;
    throw InputValidationError("unknown outcome \"" + s + "\"");
}

double costInR(const CostModel& cost, double risk_ticks) {
    if (risk_ticks == 0.0) return 0.0;
    return cost.costDollars() / (risk_ticks * cost.tick_value);
}

Classification classifyOutcome(const std::optional<SimulatedTrade>& trade,
                               const std::optional<TradePath>& path,
                               double rr,
                               const std::optional<CostModel>& cost) {
    Classification c;
    if (!trade || !path || path->exit == ExitKind::Unresolved) return c;

    if (path->exit == ExitKind::Target) {
        c.outcome = Outcome::Win;
        c.r_gross = rr;
    } else {
        c.outcome = Outcome::Loss;
        c.r_gross = -1.0;
    }

    double cost_r = cost ? costInR(*cost, trade->risk_ticks) : 0.0;
    c.r_multiple = c.r_gross - cost_r;

    if (!std::isfinite(rr) || !std::isfinite(cost_r) || !std::isfinite(c.r_multiple))
        throw ComputationIntegrityError("non-finite R-multiple (rr=" + std::to_string(rr)
                                        + " risk_ticks=" + std::to_string(trade->risk_ticks) + ")",
                                        "", "", toString(trade->direction));
    return c;
}

} // namespace orb
