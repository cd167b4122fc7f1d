#ifndef CORAL_TYPES_HPP
#define CORAL_TYPES_HPP

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace coral {

// =============================================================================
// Integer Types
// =============================================================================

using I128 = __int128;
using U128 = unsigned __int128;

// X18 fixed point: 18 decimal places, 1e18 == 1.0
constexpr I128 X18_ONE = 1000000000000000000LL;

// Basis-point denominator for fees and slippage
constexpr uint32_t BPS_DENOMINATOR = 10000;

// Reserves are bounded so every product fits the 256-bit mul_div widening
// and every UQ64.64 price fits 128 bits.
constexpr I128 MAX_RESERVE = (I128(1) << 64) - 1;

// Timestamps are seconds
using Timestamp = uint64_t;

// =============================================================================
// Token Identifiers
// =============================================================================

struct TokenId {
    std::string id;

    TokenId() = default;
    explicit TokenId(std::string s) : id(std::move(s)) {}

    bool empty() const { return id.empty(); }

    bool operator==(const TokenId& other) const { return id == other.id; }
    bool operator!=(const TokenId& other) const { return id != other.id; }
    bool operator<(const TokenId& other) const { return id < other.id; }
};

// Which reserve of a pair a token maps to
enum class Side : uint8_t {
    Zero = 0,
    One = 1
};

inline constexpr Side opposite(Side s) {
    return s == Side::Zero ? Side::One : Side::Zero;
}

inline constexpr const char* to_string(Side s) {
    return s == Side::Zero ? "token0" : "token1";
}

// Canonically ordered token pair: token0 < token1.
// Ordering is fixed once here; everything downstream works with Side.
struct TokenPair {
    TokenId token0;
    TokenId token1;

    bool is_canonical() const { return token0 < token1; }

    std::optional<Side> side_of(const TokenId& token) const {
        if (token == token0) return Side::Zero;
        if (token == token1) return Side::One;
        return std::nullopt;
    }

    const TokenId& token(Side s) const {
        return s == Side::Zero ? token0 : token1;
    }

    static TokenPair sorted(TokenId a, TokenId b) {
        if (b < a) std::swap(a, b);
        return {std::move(a), std::move(b)};
    }
};

using PairId = std::string;

// =============================================================================
// Trade Types
// =============================================================================

enum class TradeType : uint8_t {
    EXACT_IN = 0,
    EXACT_OUT = 1
};

// Values supplied by settlement for one mutation
struct SettlementContext {
    Timestamp timestamp;
    int32_t fee_signal_bps = 0;  // Externally metered EMA input
};

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;
constexpr int32_t ARITHMETIC_OVERFLOW = -1;
constexpr int32_t DIVISION_BY_ZERO = -2;
constexpr int32_t PAIR_NOT_FOUND = -3;
constexpr int32_t INSUFFICIENT_LIQUIDITY = -4;
constexpr int32_t INSUFFICIENT_INPUT_AMOUNT = -5;
constexpr int32_t INSUFFICIENT_INITIAL_LIQUIDITY = -6;
constexpr int32_t SLIPPAGE_EXCEEDED = -7;
constexpr int32_t INVALID_FEE_CONFIG = -8;
constexpr int32_t FLASH_LOANS_DISABLED = -9;
constexpr int32_t INSUFFICIENT_BALANCE = -10;
constexpr int32_t DEADLINE_EXCEEDED = -11;
constexpr int32_t INVALID_TOKEN = -20;
constexpr int32_t TOKENS_NOT_SORTED = -21;
constexpr int32_t INVALID_ARGUMENT = -22;
constexpr int32_t REENTRANCY = -30;
constexpr int32_t INVALID_CONFIG = -40;

inline constexpr const char* name(int32_t code) {
    switch (code) {
        case OK: return "Ok";
        case ARITHMETIC_OVERFLOW: return "ArithmeticOverflow";
        case DIVISION_BY_ZERO: return "DivisionByZero";
        case PAIR_NOT_FOUND: return "PairNotFound";
        case INSUFFICIENT_LIQUIDITY: return "InsufficientLiquidity";
        case INSUFFICIENT_INPUT_AMOUNT: return "InsufficientInputAmount";
        case INSUFFICIENT_INITIAL_LIQUIDITY: return "InsufficientInitialLiquidity";
        case SLIPPAGE_EXCEEDED: return "SlippageExceeded";
        case INVALID_FEE_CONFIG: return "InvalidFeeConfig";
        case FLASH_LOANS_DISABLED: return "FlashLoansDisabled";
        case INSUFFICIENT_BALANCE: return "InsufficientBalance";
        case DEADLINE_EXCEEDED: return "DeadlineExceeded";
        case INVALID_TOKEN: return "InvalidToken";
        case TOKENS_NOT_SORTED: return "TokensNotSorted";
        case INVALID_ARGUMENT: return "InvalidArgument";
        case REENTRANCY: return "Reentrancy";
        case INVALID_CONFIG: return "InvalidConfig";
    }
    return "Unknown";
}

// Errors a caller may resolve by fetching a fresh quote
inline constexpr bool should_requote(int32_t code) {
    return code == SLIPPAGE_EXCEEDED || code == DEADLINE_EXCEEDED;
}
} // namespace errors

// Terminal failure of a core operation
class AmmError : public std::runtime_error {
public:
    AmmError(int32_t code, const std::string& msg)
        : std::runtime_error(std::string(errors::name(code)) + ": " + msg),
          code_(code), detail_(msg) {}

    int32_t code() const noexcept { return code_; }
    const char* name() const noexcept { return errors::name(code_); }

    // Message without the code name prefix
    const std::string& detail() const noexcept { return detail_; }

private:
    int32_t code_;
    std::string detail_;
};

} // namespace coral

#endif // CORAL_TYPES_HPP
