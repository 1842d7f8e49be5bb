/// @file config.cpp
/// @brief GameSettings parsing and GameConfig counters

#include <critter_engine/game/config.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <limits>
#include <sstream>

namespace critter_game {

using critter_core::Err;
using critter_core::Error;
using critter_core::ErrorCode;
using critter_core::GameError;
using critter_core::Ok;
using critter_core::Result;

// =============================================================================
// JSON Parsing Helpers
// =============================================================================

namespace {

/// Read an optional unsigned field, checking it fits in max
Result<bool> read_unsigned(const nlohmann::json& j, const char* key, std::uint64_t max, std::uint64_t& out) {
    if (!j.contains(key)) {
        return Ok(false);
    }
    const auto& value = j[key];
    if (!value.is_number_unsigned()) {
        return Err<bool>(Error(ErrorCode::ParseError,
            std::string("Field '") + key + "' must be a non-negative integer"));
    }
    std::uint64_t raw = value.get<std::uint64_t>();
    if (raw > max) {
        return Err<bool>(Error(ErrorCode::ValidationError,
            std::string("Field '") + key + "' out of range: " + std::to_string(raw)));
    }
    out = raw;
    return Ok(true);
}

/// Read an optional array of exactly NUM_ITEM_TIERS unsigned values
Result<bool> read_tier_array(
    const nlohmann::json& j,
    const char* key,
    std::array<std::uint64_t, NUM_ITEM_TIERS>& out)
{
    if (!j.contains(key)) {
        return Ok(false);
    }
    const auto& arr = j[key];
    if (!arr.is_array() || arr.size() != NUM_ITEM_TIERS) {
        return Err<bool>(Error(ErrorCode::ParseError,
            std::string("Field '") + key + "' must be an array of " + std::to_string(NUM_ITEM_TIERS) + " integers"));
    }
    for (std::size_t i = 0; i < NUM_ITEM_TIERS; ++i) {
        if (!arr[i].is_number_unsigned()) {
            return Err<bool>(Error(ErrorCode::ParseError,
                std::string("Field '") + key + "[" + std::to_string(i) + "]' must be a non-negative integer"));
        }
        out[i] = arr[i].get<std::uint64_t>();
    }
    return Ok(true);
}

Result<bool> read_player(const nlohmann::json& j, const char* key, PlayerId& out) {
    std::uint64_t raw = 0;
    auto result = read_unsigned(j, key, std::numeric_limits<std::uint64_t>::max(), raw);
    if (result && *result) {
        out = PlayerId{raw};
    }
    return result;
}

} // anonymous namespace

// =============================================================================
// GameSettings
// =============================================================================

Result<void> GameSettings::validate() const {
    if (!authority) {
        return Err(Error(ErrorCode::ValidationError, "Settings must name an authority"));
    }
    if (!treasury) {
        return Err(Error(ErrorCode::ValidationError, "Settings must name a treasury account"));
    }
    if (!vault_account) {
        return Err(Error(ErrorCode::ValidationError, "Settings must name a vault account"));
    }

    for (std::size_t tier = 0; tier < NUM_ITEM_TIERS; ++tier) {
        if (item_prices[tier] == 0) {
            return Err(Error(GameError::zero_price(static_cast<std::uint32_t>(tier))));
        }
        if (catch_rates[tier] > 100) {
            return Err(Error(GameError::invalid_catch_rate(catch_rates[tier])));
        }
    }

    if (max_active == 0 || max_active > MAX_CREATURE_SLOTS) {
        return Err(Error(GameError::invalid_max_active(max_active, static_cast<std::uint32_t>(MAX_CREATURE_SLOTS))));
    }
    if (max_attempts == 0) {
        return Err(Error(ErrorCode::ValidationError, "max_attempts must be at least 1"));
    }
    if (max_coordinate == 0) {
        return Err(Error(ErrorCode::ValidationError, "max_coordinate must be at least 1"));
    }
    if (vault_capacity == 0 || vault_capacity > MAX_VAULT_SIZE) {
        return Err(Error(ErrorCode::ValidationError,
            "vault_capacity must be 1-" + std::to_string(MAX_VAULT_SIZE) + ", got " + std::to_string(vault_capacity)));
    }
    if (max_purchase_amount == 0) {
        return Err(Error(ErrorCode::ValidationError, "max_purchase_amount must be greater than 0"));
    }
    return Ok();
}

Result<GameSettings> GameSettings::from_json_string(const std::string& json_str) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_str);
    } catch (const nlohmann::json::parse_error& e) {
        return Err<GameSettings>(Error(ErrorCode::ParseError, std::string("JSON parse error: ") + e.what()));
    }

    if (!j.is_object()) {
        return Err<GameSettings>(Error(ErrorCode::ParseError, "Game settings must be a JSON object"));
    }

    GameSettings settings;

    for (auto [key, target] : {
            std::pair<const char*, PlayerId*>{"authority", &settings.authority},
            std::pair<const char*, PlayerId*>{"treasury", &settings.treasury},
            std::pair<const char*, PlayerId*>{"vault_account", &settings.vault_account}}) {
        auto result = read_player(j, key, *target);
        if (!result) {
            return Err<GameSettings>(result.error());
        }
    }

    auto prices = read_tier_array(j, "item_prices", settings.item_prices);
    if (!prices) {
        return Err<GameSettings>(prices.error());
    }

    std::array<std::uint64_t, NUM_ITEM_TIERS> rates{};
    auto rates_result = read_tier_array(j, "catch_rates", rates);
    if (!rates_result) {
        return Err<GameSettings>(rates_result.error());
    }
    if (*rates_result) {
        for (std::size_t tier = 0; tier < NUM_ITEM_TIERS; ++tier) {
            if (rates[tier] > 100) {
                return Err<GameSettings>(Error(GameError::invalid_catch_rate(
                    static_cast<std::uint32_t>(std::min<std::uint64_t>(rates[tier], std::numeric_limits<std::uint32_t>::max())))));
            }
            settings.catch_rates[tier] = static_cast<std::uint8_t>(rates[tier]);
        }
    }

    std::uint64_t value = 0;

    auto max_active = read_unsigned(j, "max_active", std::numeric_limits<std::uint8_t>::max(), value);
    if (!max_active) {
        return Err<GameSettings>(max_active.error());
    }
    if (*max_active) {
        settings.max_active = static_cast<std::uint8_t>(value);
    }

    auto max_attempts = read_unsigned(j, "max_attempts", std::numeric_limits<std::uint8_t>::max(), value);
    if (!max_attempts) {
        return Err<GameSettings>(max_attempts.error());
    }
    if (*max_attempts) {
        settings.max_attempts = static_cast<std::uint8_t>(value);
    }

    auto max_coordinate = read_unsigned(j, "max_coordinate", std::numeric_limits<std::uint16_t>::max(), value);
    if (!max_coordinate) {
        return Err<GameSettings>(max_coordinate.error());
    }
    if (*max_coordinate) {
        settings.max_coordinate = static_cast<std::uint16_t>(value);
    }

    auto capacity = read_unsigned(j, "vault_capacity", MAX_VAULT_SIZE, value);
    if (!capacity) {
        return Err<GameSettings>(capacity.error());
    }
    if (*capacity) {
        settings.vault_capacity = static_cast<std::size_t>(value);
    }

    auto max_purchase = read_unsigned(j, "max_purchase_amount", std::numeric_limits<std::uint64_t>::max(), value);
    if (!max_purchase) {
        return Err<GameSettings>(max_purchase.error());
    }
    if (*max_purchase) {
        settings.max_purchase_amount = value;
    }

    return Ok(settings);
}

Result<GameSettings> GameSettings::from_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Err<GameSettings>(Error(ErrorCode::NotFound, "Settings file not found: " + path.string()));
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return Err<GameSettings>(Error(ErrorCode::IOError, "Failed to open settings file: " + path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto result = from_json_string(buffer.str());
    if (!result) {
        return Err<GameSettings>(Error(result.error()).with_context("file", path.string()));
    }
    return result;
}

std::string GameSettings::to_json() const {
    nlohmann::json j;
    j["authority"] = authority.value;
    j["treasury"] = treasury.value;
    j["vault_account"] = vault_account.value;
    j["item_prices"] = item_prices;
    j["catch_rates"] = nlohmann::json::array();
    for (std::uint8_t rate : catch_rates) {
        j["catch_rates"].push_back(static_cast<std::uint32_t>(rate));
    }
    j["max_active"] = static_cast<std::uint32_t>(max_active);
    j["max_attempts"] = static_cast<std::uint32_t>(max_attempts);
    j["max_coordinate"] = max_coordinate;
    j["vault_capacity"] = vault_capacity;
    j["max_purchase_amount"] = max_purchase_amount;
    return j.dump(4);
}

// =============================================================================
// GameConfig
// =============================================================================

GameConfig GameConfig::from_settings(const GameSettings& settings) {
    GameConfig config;
    config.authority = settings.authority;
    config.treasury = settings.treasury;
    config.vault_account = settings.vault_account;
    config.item_prices = settings.item_prices;
    config.catch_rates = settings.catch_rates;
    config.max_active = settings.max_active;
    config.max_attempts = settings.max_attempts;
    config.max_coordinate = settings.max_coordinate;
    config.max_purchase_amount = settings.max_purchase_amount;
    config.is_initialized = true;
    return config;
}

Result<std::uint64_t> GameConfig::peek_creature_id() const {
    auto next = checked_add<std::uint64_t>(creature_id_counter, 1);
    if (!next) {
        return Err<std::uint64_t>(Error(GameError::math_overflow("creature id counter")));
    }
    return Ok(*next);
}

Result<std::uint64_t> GameConfig::peek_request_sequence() const {
    auto next = checked_add<std::uint64_t>(request_sequence, 1);
    if (!next) {
        return Err<std::uint64_t>(Error(GameError::math_overflow("request sequence")));
    }
    return Ok(*next);
}

Result<void> GameConfig::add_revenue(std::uint64_t amount) {
    auto total = checked_add<std::uint64_t>(total_revenue, amount);
    if (!total) {
        return Err(Error(GameError::math_overflow("total revenue")));
    }
    total_revenue = *total;
    return Ok();
}

Result<void> GameConfig::add_withdrawn(std::uint64_t amount) {
    auto total = checked_add<std::uint64_t>(total_withdrawn, amount);
    if (!total) {
        return Err(Error(GameError::math_overflow("total withdrawn")));
    }
    total_withdrawn = *total;
    return Ok();
}

} // namespace critter_game
