#ifndef CORAL_CONFIG_HPP
#define CORAL_CONFIG_HPP

#include <string>
#include <string_view>
#include <unordered_map>

#include "types.hpp"
#include "fee.hpp"
#include "flash.hpp"
#include "liquidity.hpp"

namespace coral {

// =============================================================================
// Pair Configuration
// =============================================================================

// Fully resolved settings for one pair
struct PairConfig {
    FeeConfig fee;
    FlashLoanConfig flash;
    I128 minimum_liquidity = DEFAULT_MINIMUM_LIQUIDITY;

    // Throws AmmError{INVALID_FEE_CONFIG} or AmmError{INVALID_CONFIG}
    void validate() const;
};

// =============================================================================
// Core Configuration
//
// JSON layout (every key optional):
//
//   {
//     "log_level": "info",
//     "minimum_liquidity": 1000,
//     "fee":   { "min_bps": 5, "max_bps": 100, "baseline_bps": 30,
//                "ema_alpha": "0.2" },
//     "flash": { "fee_bps": 9, "fee_floor": 1, "locked": false },
//     "pairs": {
//       "<pair id>": { "fee": {...}, "flash": {...}, "minimum_liquidity": 500 }
//     }
//   }
//
// Amounts accept a JSON integer or a string of digits (for values beyond
// 2^53). A per-pair block overrides individual fields of the defaults that
// precede it.
// =============================================================================

class CoreConfig {
public:
    std::string log_level = "info";
    I128 minimum_liquidity = DEFAULT_MINIMUM_LIQUIDITY;
    FeeConfig default_fee;
    FlashLoanConfig default_flash;
    std::unordered_map<PairId, PairConfig> pairs;

    CoreConfig() = default;

    // Load from JSON file. Throws std::runtime_error when the file cannot be
    // read, AmmError{INVALID_CONFIG} when its content is malformed.
    static CoreConfig from_file(std::string_view path);

    // Load from JSON string
    static CoreConfig from_json(std::string_view content);

    // Defaults plus the pair's override, if any
    PairConfig for_pair(const PairId& pair_id) const;

    // Validates defaults and every override
    void validate() const;

    // Pushes log_level onto the coral logger
    void apply_logging() const;

    // Builder methods
    CoreConfig& set_log_level(std::string_view level) {
        log_level = std::string(level);
        return *this;
    }

    CoreConfig& set_minimum_liquidity(I128 floor) {
        minimum_liquidity = floor;
        return *this;
    }

    CoreConfig& with_default_fee(const FeeConfig& fee) {
        default_fee = fee;
        return *this;
    }

    CoreConfig& with_default_flash(const FlashLoanConfig& flash) {
        default_flash = flash;
        return *this;
    }

    CoreConfig& with_pair(const PairId& pair_id, PairConfig cfg) {
        pairs[pair_id] = std::move(cfg);
        return *this;
    }
};

} // namespace coral

#endif // CORAL_CONFIG_HPP
