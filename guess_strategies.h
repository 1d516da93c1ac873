/*
 * FILE: guess_strategies.h
 *
 * WHAT:
 * Defines the configuration structure for a solver "personality" and the
 * registry of the predefined ones.
 *
 * WHY:
 * Hardcoding the choice of algorithm makes comparison difficult. With the
 * strategy described as data, the Suggest command can switch personalities
 * by name and the Simulation can race several of them against the same
 * dictionary without new code.
 */

#pragma once
#ifndef GUESS_STRATEGIES_H
#define GUESS_STRATEGIES_H

#include <stdbool.h>

/*
 * ENUM: strategy_kind_t
 *
 * The selection algorithm behind a strategy. The value indexes the dispatch
 * table in guess_selector.cpp, so keep the two in step.
 */
typedef enum _strategy_kind
{
    STRATEGY_FREQUENCY = 0,     /* Letter-frequency heuristic over the candidates   */
    STRATEGY_MINIMAX = 1,       /* Minimise the worst-case bucket over the dictionary */
    STRATEGY_KIND_COUNT = 2
} strategy_kind_t;

/*
 * STRUCT: StrategyConfig
 *
 * WHAT:
 * The configuration object for a single solver instance.
 * Passed into `select_guess` to control decision making.
 */
typedef struct
{
    // The display name of the strategy (e.g., "Minimax").
    // Used for lookup from the command line and in Simulation reports.
    const char* name;

    // --- Base Selection Algorithm ---
    strategy_kind_t kind;

    // --- Hard Mode ---
    // If true, the guess pool is limited to words that keep every Green in
    // place and use every confirmed letter.
    // WHY: Minimax likes "burner" words that cannot be the answer; Hard Mode
    // games forbid most of them.
    bool hard_mode;

    // --- Opener Override ---
    // If not NULL, forces the first guess to be this word (e.g., "crane")
    // provided it has the session length and is in the dictionary.
    // WHY: Skips the most expensive search of the game (round 1 over the
    // whole dictionary) with a known-good opener.
    const char* opener_override_word;

} StrategyConfig;

// --- GLOBAL STRATEGY DEFINITIONS ---
// Defined in guess_strategies.cpp
extern const int TOTAL_DEFINED_STRATEGIES;
extern const StrategyConfig ALL_STRATEGIES[];

/*
 * FUNCTION: find_strategy_by_name
 *
 * WHAT:
 * Case-insensitive lookup in ALL_STRATEGIES.
 *
 * RETURNS:
 * - The matching entry, or NULL if no strategy has that name.
 */
const StrategyConfig* find_strategy_by_name(const char* name);

#endif
