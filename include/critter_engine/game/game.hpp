#pragma once

/// @file game.hpp
/// @brief Main header for critter_game module
///
/// Usage:
/// ```cpp
/// critter_game::MemoryOracle oracle;
/// critter_game::MemoryAssetLedger assets;
/// critter_game::MemoryCurrencyLedger currency;
/// critter_game::CatchGame game(oracle, assets, currency);
///
/// auto settings = critter_game::GameSettings::from_file("game.json");
/// if (settings) {
///     game.initialize(settings->authority, *settings);
/// }
///
/// auto request = game.request_spawn(authority, 0);
/// // ... oracle publishes randomness for the request seed ...
/// auto outcome = game.consume(*request);
/// ```

#include "fwd.hpp"
#include "types.hpp"
#include "randomness.hpp"
#include "slots.hpp"
#include "vault.hpp"
#include "oracle.hpp"
#include "transfer.hpp"
#include "ledger.hpp"
#include "config.hpp"
#include "events.hpp"
#include "catch_game.hpp"
