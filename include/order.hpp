#pragma once

#include <string>

namespace orb {

enum class Direction { Up, Down };

/// FULL = stop at the opposite range boundary; HALF = stop at the midpoint.
enum class StopMode { Full, Half };

/// CLOSE = fill at the confirming bar's close; NEXT_OPEN = fill at the open of the following bar.
enum class EntryMode { Close, NextOpen };

/// What risk and target are measured from.
/// ORB_EDGE: broken boundary to stop; target = edge +/- RR * risk.
/// ENTRY: entry price to stop; target = entry +/- RR * risk.
enum class RiskAnchor { OrbEdge, Entry };

/// FIRST_BREAK: only the first confirmed breakout of a window is traded.
/// INDEPENDENT: each direction looks for its own first confirmed breakout.
enum class DirectionPolicy { FirstBreak, Independent };

const char* toString(Direction d);
const char* toString(StopMode m);
const char* toString(EntryMode m);
const char* toString(RiskAnchor a);
const char* toString(DirectionPolicy p);

/// Case-insensitive parsers. Throw InputValidationError on unknown names.
Direction parseDirection(const std::string& s);
StopMode parseStopMode(const std::string& s);
EntryMode parseEntryMode(const std::string& s);
RiskAnchor parseRiskAnchor(const std::string& s);
DirectionPolicy parseDirectionPolicy(const std::string& s);

inline Direction opposite(Direction d) { return d == Direction::Up ? Direction::Down : Direction::Up; }

} // namespace orb
