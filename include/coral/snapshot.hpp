#ifndef CORAL_SNAPSHOT_HPP
#define CORAL_SNAPSHOT_HPP

#include "types.hpp"
#include "reserves.hpp"
#include "fee.hpp"
#include "flash.hpp"
#include "oracle.hpp"

namespace coral {

// =============================================================================
// Pair Snapshot
//
// Consistent copy of one pair's state, taken under the pair's shared lock.
// Quotes computed from a snapshot are advisory: a concurrent settlement may
// move the reserves before the quote executes, which is what the min/max
// guards on every quote are for.
// =============================================================================

struct PairSnapshot {
    PairId pair_id;
    TokenPair tokens;
    Reserves reserves;
    FeeState fee;
    FlashLoanConfig flash;
    Observation oracle;

    bool has_liquidity() const {
        return reserves.reserve0 > 0 && reserves.reserve1 > 0;
    }
};

} // namespace coral

#endif // CORAL_SNAPSHOT_HPP
