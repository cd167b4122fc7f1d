// =============================================================================
// config.cpp - JSON configuration
// =============================================================================

#include "coral/config.hpp"
#include "coral/log.hpp"
#include "coral/units.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace coral {

using json = nlohmann::json;

namespace {

[[noreturn]] void invalid(const std::string& what) {
    throw AmmError(errors::INVALID_CONFIG, what);
}

uint32_t read_bps(const json& obj, const char* key, uint32_t fallback) {
    auto it = obj.find(key);
    if (it == obj.end()) return fallback;
    if (!it->is_number_unsigned()) {
        invalid(std::string(key) + " must be a non-negative integer");
    }
    uint64_t v = it->get<uint64_t>();
    if (v > BPS_DENOMINATOR) {
        invalid(std::string(key) + " above 10000 bps");
    }
    return static_cast<uint32_t>(v);
}

I128 read_amount(const json& obj, const char* key, I128 fallback) {
    auto it = obj.find(key);
    if (it == obj.end()) return fallback;
    if (it->is_number_unsigned()) {
        return static_cast<I128>(it->get<uint64_t>());
    }
    if (it->is_string()) {
        try {
            return to_atomic(it->get<std::string>(), 0);
        } catch (const AmmError& e) {
            invalid(std::string(key) + ": " + e.detail());
        }
    }
    invalid(std::string(key) + " must be an integer or a digit string");
}

FeeConfig read_fee(const json& obj, FeeConfig fee) {
    if (!obj.is_object()) invalid("fee must be an object");
    fee.fee_min_bps = read_bps(obj, "min_bps", fee.fee_min_bps);
    fee.fee_max_bps = read_bps(obj, "max_bps", fee.fee_max_bps);
    fee.baseline_fee_bps = read_bps(obj, "baseline_bps", fee.baseline_fee_bps);

    auto alpha = obj.find("ema_alpha");
    if (alpha != obj.end()) {
        if (!alpha->is_string()) {
            invalid("ema_alpha must be a decimal string such as \"0.2\"");
        }
        try {
            fee.ema_alpha_x18 = to_x18(alpha->get<std::string>());
        } catch (const AmmError& e) {
            invalid("ema_alpha: " + e.detail());
        }
    }
    return fee;
}

FlashLoanConfig read_flash(const json& obj, FlashLoanConfig flash) {
    if (!obj.is_object()) invalid("flash must be an object");
    flash.fee_bps = read_bps(obj, "fee_bps", flash.fee_bps);
    flash.fee_floor = read_amount(obj, "fee_floor", flash.fee_floor);

    auto locked = obj.find("locked");
    if (locked != obj.end()) {
        if (!locked->is_boolean()) invalid("locked must be a boolean");
        flash.locked = locked->get<bool>();
    }
    return flash;
}

PairConfig read_pair(const json& obj, PairConfig cfg) {
    if (!obj.is_object()) invalid("pair entry must be an object");
    if (obj.contains("fee")) cfg.fee = read_fee(obj.at("fee"), cfg.fee);
    if (obj.contains("flash")) cfg.flash = read_flash(obj.at("flash"), cfg.flash);
    cfg.minimum_liquidity = read_amount(obj, "minimum_liquidity", cfg.minimum_liquidity);
    return cfg;
}

bool known_level(const std::string& level) {
    for (const char* name : {"trace", "debug", "info", "warn", "warning",
                             "error", "err", "critical", "off"}) {
        if (level == name) return true;
    }
    return false;
}

} // anonymous namespace

void PairConfig::validate() const {
    fee_engine::validate(fee);
    flash.validate();
    if (minimum_liquidity < 0) {
        invalid("minimum_liquidity must be non-negative");
    }
}

CoreConfig CoreConfig::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

CoreConfig CoreConfig::from_json(std::string_view content) {
    CoreConfig config;
    try {
        json root = json::parse(content.begin(), content.end());
        if (!root.is_object()) invalid("top level must be an object");

        auto level = root.find("log_level");
        if (level != root.end()) {
            if (!level->is_string()) invalid("log_level must be a string");
            config.log_level = level->get<std::string>();
        }
        config.minimum_liquidity = read_amount(root, "minimum_liquidity",
                                               config.minimum_liquidity);
        if (root.contains("fee")) {
            config.default_fee = read_fee(root.at("fee"), config.default_fee);
        }
        if (root.contains("flash")) {
            config.default_flash = read_flash(root.at("flash"), config.default_flash);
        }

        auto pairs = root.find("pairs");
        if (pairs != root.end()) {
            if (!pairs->is_object()) invalid("pairs must be an object");
            PairConfig defaults{config.default_fee, config.default_flash,
                                config.minimum_liquidity};
            for (const auto& [id, entry] : pairs->items()) {
                config.pairs[id] = read_pair(entry, defaults);
            }
        }
    } catch (const json::exception& e) {
        invalid(std::string("malformed JSON: ") + e.what());
    }

    config.validate();
    return config;
}

PairConfig CoreConfig::for_pair(const PairId& pair_id) const {
    auto it = pairs.find(pair_id);
    if (it != pairs.end()) {
        return it->second;
    }
    return PairConfig{default_fee, default_flash, minimum_liquidity};
}

void CoreConfig::validate() const {
    if (!known_level(log_level)) {
        invalid("unknown log_level: " + log_level);
    }
    PairConfig{default_fee, default_flash, minimum_liquidity}.validate();
    for (const auto& [id, cfg] : pairs) {
        try {
            cfg.validate();
        } catch (const AmmError& e) {
            throw AmmError(e.code(), "pair " + id + ": " + e.detail());
        }
    }
}

void CoreConfig::apply_logging() const {
    if (!log::set_level(log_level)) {
        invalid("unknown log_level: " + log_level);
    }
}

} // namespace coral
