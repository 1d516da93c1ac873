/*
 * FILE: candidate_filter.h
 *
 * WHAT:
 * Defines the interface for pruning a word set down to the words that are
 * still consistent with everything in a Knowledge State.
 *
 * WHY:
 * This is the mechanism that narrows the search space. It is deliberately
 * stateless: each round the caller re-filters the FULL length-L dictionary
 * against the full accumulated state, so a mistake in an earlier round can
 * only ever show up as an empty result, never as a silently wrong one.
 */

#pragma once
#ifndef CANDIDATE_FILTER_H
#define CANDIDATE_FILTER_H
#include "solver_types.h"

/*
 * FUNCTION: is_candidate_consistent
 *
 * WHAT:
 * True if `word` satisfies every constraint in `p_state`:
 * greens, excluded letters, minimum counts, exact counts and yellow
 * position exclusions. A contradictory state accepts nothing.
 */
bool is_candidate_consistent(const knowledge_state_t* p_state, const char* word);

/*
 * FUNCTION: filter_dictionary
 *
 * WHAT:
 * Scans the master word array and writes a pointer to every consistent word
 * into `pp_candidates`, preserving dictionary order.
 *
 * PARAMETERS:
 * - p_dictionary / dictionary_count: the length-L dictionary.
 * - pp_candidates: output view, capacity >= dictionary_count.
 *
 * RETURNS:
 * - The number of candidates written. 0 means the feedback history admits no
 *   word at all (contradictory or mistyped feedback).
 */
int filter_dictionary(const knowledge_state_t* p_state,
    const word_t* p_dictionary,
    int dictionary_count,
    candidate_array_t pp_candidates);

/*
 * FUNCTION: filter_candidates
 *
 * WHAT:
 * Same as `filter_dictionary`, but over an existing view. `pp_out` may be
 * the same array as `pp_in` (in-place compaction keeps the order).
 *
 * RETURNS:
 * - The number of candidates written to `pp_out`.
 */
int filter_candidates(const knowledge_state_t* p_state,
    const word_t* const* pp_in,
    int in_count,
    candidate_array_t pp_out);

#endif
