/*
 * FILE: knowledge_state.h
 *
 * WHAT:
 * Defines the interface for accumulating constraints from the
 * (guess, feedback) history of a session.
 *
 * WHY:
 * The Candidate Filter and the Hard Mode Validator both need the same
 * distilled view of "what do we know so far". Folding every round into one
 * explicit state object means the filter can always be re-run from the full
 * dictionary, and the state can be copied by value into simulations.
 */

#pragma once
#ifndef KNOWLEDGE_STATE_H
#define KNOWLEDGE_STATE_H
#include "solver_types.h"

/*
 * FUNCTION: init_knowledge_state
 *
 * WHAT:
 * Resets `p_state` to "nothing known" for words of `word_length` letters.
 *
 * RETURNS:
 * - false if `word_length` is outside 1..MAX_WORD_LENGTH.
 */
bool init_knowledge_state(knowledge_state_t* p_state, int word_length);

/*
 * FUNCTION: update_knowledge_state
 *
 * WHAT:
 * Folds one guess and its feedback into the state.
 * - Green: pins the letter at that position.
 * - Yellow: forbids the letter at that position.
 * - Per letter of the guess: Green+Yellow marks raise the minimum count; a
 *   Grey mark on a letter that also scored pins the exact count; a letter
 *   with no Green/Yellow mark at all is excluded (unless an earlier guess
 *   proved it present, which marks the state contradictory instead).
 *
 * Constraints only ever tighten. When the new feedback conflicts with what
 * is already known, `is_contradictory` is set and stays set; the candidate
 * set computed from such a state is empty.
 *
 * RETURNS:
 * - false if the guess, the feedback and the state disagree on the word
 *   length (the state is left untouched).
 */
bool update_knowledge_state(knowledge_state_t* p_state, const char* guess, const feedback_pattern_t* p_feedback);

/*
 * FUNCTION: is_letter_confirmed
 *
 * True once the letter has been seen Green or Yellow (min_count > 0).
 */
bool is_letter_confirmed(const knowledge_state_t* p_state, char letter);

/*
 * FUNCTION: has_max_count
 *
 * True when the exact number of occurrences of `letter` is known.
 */
bool has_max_count(const knowledge_state_t* p_state, char letter);

/*
 * FUNCTION: print_knowledge_state
 *
 * WHAT:
 * Prints a compact summary, e.g.
 *   Pattern : c.a.e
 *   Present : s(min 1, not at 1) e(exactly 2)
 *   Absent  : d p r
 *
 * WHY:
 * Lets the user check that the feedback they typed was understood the way
 * they meant it.
 */
void print_knowledge_state(const knowledge_state_t* p_state);

#endif
