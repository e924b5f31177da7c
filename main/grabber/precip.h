#ifndef HC_PRECIP_H
#define HC_PRECIP_H

#include <vector>
#include "gridseries.h"
#include "common/payload.h"

namespace precip {
	using payload::PrecipitationPeriod;
	using payload::UnitSystem;

	// Smallest amount (display units) the rendering layer should label. Frozen precipitation needs a lot
	// more before it is worth showing.
	double display_threshold(PrecipitationPeriod::Kind kind, UnitSystem units);

	// Turns a raw precipitation series into periods clipped to the display window starting at the top of
	// the hour containing now. Records with a zero, negative or missing amount are dropped; nothing is
	// coalesced.
	std::vector<PrecipitationPeriod> extract(const gridseries::Series& series, int64_t now, int window_hours,
			UnitSystem units, PrecipitationPeriod::Kind kind);

	// Reconciles liquid and frozen periods so each start index is claimed at most once:
	//  - a positive frozen period replaces the liquid one at the same start index
	//  - a liquid period starting at or below freezing (per hourly temperature) is dropped
	//  - remaining positive frozen periods are kept
	std::vector<PrecipitationPeriod> merge(const std::vector<PrecipitationPeriod>& liquid,
			const std::vector<PrecipitationPeriod>& frozen,
			const std::vector<payload::HourlySample>& hourly, UnitSystem units);
}

#endif
