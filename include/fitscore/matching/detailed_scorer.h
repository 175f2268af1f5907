#pragma once

#include "fitscore/domain/profile.h"
#include "fitscore/domain/sub_scores.h"

namespace fitscore::matching {

// detailed_scores runs the four sub-scorers on a candidate/job pair.
// Total: every field of the result is set and lies in [0,1] for any input.
[[nodiscard]] domain::SubScoreSet detailed_scores(const domain::Profile& candidate,
                                                  const domain::Profile& job);

}  // namespace fitscore::matching
