/*
 * FILE: guess_selector.h
 *
 * WHAT:
 * Defines the interface for choosing the next guess.
 * Two interchangeable algorithms share one contract
 * (candidates + dictionary -> word or NULL):
 * 1. Frequency: the candidate covering the most common letters.
 * 2. Minimax: the dictionary word whose worst-case feedback bucket is smallest.
 *
 * WHY:
 * Separation of concerns. The shell only ever calls `select_guess` with a
 * StrategyConfig; which algorithm runs, and how the guess pool is formed
 * (opener override, Hard Mode restriction), is decided here.
 */

#pragma once
#ifndef GUESS_SELECTOR_H
#define GUESS_SELECTOR_H
#include "solver_types.h"
#include "guess_strategies.h"

/*
 * CONSTANT: MINIMAX_NARROW_THRESHOLD
 *
 * Once this few candidates remain, Minimax only considers the candidates
 * themselves as guesses: with 1 or 2 words left the best play is to guess
 * one of them.
 */
const int MINIMAX_NARROW_THRESHOLD = 2;

/*
 * CONSTANT: MAX_DENSE_PATTERN_LENGTH
 *
 * Up to this word length, bucket sizes are tallied in a dense histogram of
 * 3^L ints per thread (3^10 ints = 236 KB). Longer words fall back to
 * sorting the pattern indices.
 */
const int MAX_DENSE_PATTERN_LENGTH = 10;

/*
 * FUNCTION: select_guess
 *
 * WHAT:
 * The single entry point used by the shell.
 * 1. No candidates: returns NULL (the feedback history is contradictory).
 * 2. First round with an opener override in the dictionary: returns it.
 * 3. Otherwise builds the guess pool (the dictionary, or only its Hard Mode
 *    legal words) and dispatches to the configured algorithm.
 *
 * PARAMETERS:
 * - p_config: The strategy to apply.
 * - pp_candidates / candidate_count: Words still consistent with the state.
 * - p_dictionary / dictionary_count: The length-L dictionary.
 * - p_state: The current knowledge (round number and Hard Mode rules).
 *
 * RETURNS:
 * - A pointer into the dictionary or the candidate view, or NULL.
 */
const word_t* select_guess(const StrategyConfig* p_config,
    const word_t* const* pp_candidates,
    int candidate_count,
    const word_t* p_dictionary,
    int dictionary_count,
    const knowledge_state_t* p_state);

/*
 * FUNCTION: select_frequency_guess
 *
 * WHAT:
 * Counts, for each letter, how many candidates contain it (each candidate
 * counts a letter once however often it repeats it), scores each candidate
 * as the sum of its distinct letters' counts, and returns the top scorer.
 * Ties go to the earliest candidate.
 *
 * RETURNS:
 * - NULL if `candidate_count` is 0.
 */
const word_t* select_frequency_guess(const word_t* const* pp_candidates, int candidate_count);

/*
 * FUNCTION: select_minimax_guess
 *
 * WHAT:
 * For every word of the pool, partitions the candidates by the feedback the
 * word would receive from each of them and records the largest partition.
 * Returns the word with the smallest largest partition. Ties prefer a word
 * that is itself a candidate, then the earliest pool position. When at most
 * MINIMAX_NARROW_THRESHOLD candidates remain the pool is the candidates.
 *
 * The outer loop runs in parallel (OpenMP). The result does not depend on
 * the number of threads.
 *
 * PARAMETERS:
 * - pp_pool / pool_count: Words allowed as guesses.
 * - p_worst_case: Optional output, the chosen word's largest bucket size.
 *
 * RETURNS:
 * - NULL if there are no candidates or scratch memory could not be allocated.
 */
const word_t* select_minimax_guess(const word_t* const* pp_candidates,
    int candidate_count,
    const word_t* const* pp_pool,
    int pool_count,
    int* p_worst_case);

/*
 * FUNCTION: compute_worst_case_bucket
 *
 * WHAT:
 * The size of the largest bucket when the candidates are partitioned by the
 * feedback `guess` receives from each of them.
 *
 * RETURNS:
 * - The bucket size (0 when there are no candidates), or -1 on allocation
 *   failure.
 */
int compute_worst_case_bucket(const char* guess, const word_t* const* pp_candidates, int candidate_count);

#endif
