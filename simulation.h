/*
 * FILE: simulation.h
 *
 * WHAT:
 * Defines the interface for the Simulation Engine ("The Tournament").
 * Each selected strategy plays a full game against every dictionary word
 * (or the first N of them) as the secret, and the results are compared.
 *
 * WHY:
 * "Gut feeling" is not enough to choose between Frequency and Minimax.
 * Playing every possible secret gives the exact win rate and average guess
 * count of a strategy on a given word list. The games drive the engine only
 * through its public API (encode, update, filter, select), so the tournament
 * doubles as an end-to-end check of the whole engine.
 */

#pragma once
#ifndef SIMULATION_H
#define SIMULATION_H
#include "solver_types.h"
#include "guess_strategies.h"

/*
 * CONSTANT: MAX_SIMULATION_GUESSES
 *
 * Upper bound for the per-game guess limit (the standard game allows 6).
 */
const int MAX_SIMULATION_GUESSES = 20;

/*
 * STRUCT: SimStats
 *
 * FIELDS:
 * - games/wins/losses: Raw counts.
 * - contradictions: Games where the candidate set became empty. Always 0
 *   unless the engine itself is broken, since the feedback is generated.
 * - guess_distribution: Histogram, index = number of guesses used to win.
 * - average_guesses: Mean guesses over won games.
 * - time_taken: Wall-clock seconds.
 */
typedef struct _sim_stats
{
    char strategy_name[64];
    char opening_word[MAX_WORD_LENGTH + 1];
    int games;
    int wins;
    int losses;
    int contradictions;
    long total_guesses;
    int guess_distribution[MAX_SIMULATION_GUESSES + 1];
    double average_guesses;
    double win_percent;
    double time_taken;
} SimStats;

/*
 * FUNCTION: play_simulated_game
 *
 * WHAT:
 * Plays one game of `p_config` against `secret`, starting with
 * `opening_word` (computed with `select_guess` if NULL).
 *
 * PARAMETERS:
 * - pp_scratch: A view with capacity >= dictionary_count, reused per game.
 * - p_guesses_taken: Output. Guesses used (including the winning one).
 * - p_contradiction: Output (optional). Set if the candidate set emptied.
 *
 * RETURNS:
 * - true if the secret was guessed within `max_guesses`.
 */
bool play_simulated_game(const StrategyConfig* p_config,
    const word_t* p_dictionary,
    int dictionary_count,
    const char* secret,
    const char* opening_word,
    int max_guesses,
    candidate_array_t pp_scratch,
    int* p_guesses_taken,
    bool* p_contradiction);

/*
 * FUNCTION: run_strategy_simulation
 *
 * WHAT:
 * Determines the opener once, then plays every target word in parallel
 * (OpenMP, one scratch view per thread) and aggregates the statistics.
 *
 * PARAMETERS:
 * - target_count: Number of leading dictionary words used as secrets
 *   (clamped to dictionary_count).
 * - verbose: Print progress lines.
 *
 * RETURNS:
 * - false on allocation failure (stats are then incomplete).
 */
bool run_strategy_simulation(const StrategyConfig* p_config,
    const word_t* p_dictionary,
    int dictionary_count,
    int target_count,
    int max_guesses,
    bool verbose,
    SimStats* p_stats);

/*
 * FUNCTION: run_tournament
 *
 * WHAT:
 * The Tournament Director.
 * 1. Calls `run_strategy_simulation` for each roster entry.
 * 2. Prints the comparison table.
 * 3. Names the champion (highest win %, then lowest average) and prints
 *    its guess distribution.
 *
 * RETURNS:
 * - false if any strategy failed to simulate.
 */
bool run_tournament(const StrategyConfig* roster,
    int roster_size,
    const word_t* p_dictionary,
    int dictionary_count,
    int target_count,
    int max_guesses,
    bool verbose);

/*
 * FUNCTION: print_distribution
 *
 * Prints a histogram of the guess distribution of a finished simulation.
 */
void print_distribution(const SimStats* p_stats, int max_guesses);

#endif
