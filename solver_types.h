/*
 * FILE: solver_types.h
 *
 * WHAT:
 * Defines the core data structures and constants shared by the engine
 * (Pattern Encoder, Knowledge State, Candidate Filter, Guess Selector) and
 * by the shell (Word Source, Suggest, Simulation).
 *
 * WHY:
 * A single definition of "what a word is" and "what a feedback pattern is"
 * keeps every layer speaking the same fixed-width format. Words are stored
 * inline (no per-word heap allocation) so the hot loops in the Minimax search
 * walk contiguous memory.
 */

#pragma once
#ifndef SOLVER_TYPES_H
#define SOLVER_TYPES_H

#include <stdlib.h>
#include <stdbool.h>

/*
 * CONSTANTS: Session Limits
 *
 * MAX_WORD_LENGTH bounds L for any session. 16 keeps the base-3 pattern index
 * (3^16 = 43,046,721) inside an int and the per-letter position masks inside
 * 32 bits.
 *
 * ALPHABET_SIZE is the lower-case Latin alphabet. The shell lower-cases
 * everything before it reaches the engine.
 */
const int MAX_WORD_LENGTH = 16;
const int ALPHABET_SIZE = 26;

/*
 * CONSTANT: NO_MAX_COUNT
 *
 * Sentinel stored in `knowledge_state_t::max_count` while the exact
 * occurrence count of a letter is still unknown.
 */
const int NO_MAX_COUNT = -1;

/*
 * ENUM: feedback_mark_t
 *
 * The three feedback classes. The numeric values are the base-3 digits used
 * by `compute_pattern_index`, so they must stay 0/1/2.
 */
typedef enum _feedback_mark
{
    MARK_ABSENT = 0,    /* Grey   */
    MARK_PRESENT = 1,   /* Yellow */
    MARK_EXACT = 2      /* Green  */
} feedback_mark_t;

/*
 * STRUCT: word_t
 *
 * One dictionary word, lower-case, null terminated. The session length L is
 * held by whoever owns the array (dictionary, knowledge state), not per word.
 */
typedef struct _word
{
    char letters[MAX_WORD_LENGTH + 1];
} word_t;

/*
 * STRUCT: feedback_pattern_t
 *
 * The per-position feedback for one guess. Only the first `length` marks
 * are meaningful.
 */
typedef struct _feedback_pattern
{
    int length;
    unsigned char marks[MAX_WORD_LENGTH];
} feedback_pattern_t;

/*
 * STRUCT: knowledge_state_t
 *
 * Everything learned so far in a session. Mutated only by
 * `update_knowledge_state`; every other component reads it.
 *
 * FIELDS:
 * - green_at: Letter confirmed EXACT at each position, '\0' when unknown.
 * - yellow_exclusions: Per letter, bit i set = letter came back PRESENT at
 *   position i, so it cannot sit there.
 * - min_count: Lower bound on occurrences (0 = nothing known).
 * - max_count: Exact occurrence count, or NO_MAX_COUNT.
 * - excluded: Letters confirmed to be absent from the secret.
 * - rounds_applied: How many (guess, feedback) pairs have been folded in.
 * - is_contradictory: Set once the history can no longer describe any word.
 */
typedef struct _knowledge_state
{
    int word_length;
    char green_at[MAX_WORD_LENGTH];
    unsigned int yellow_exclusions[ALPHABET_SIZE];
    int min_count[ALPHABET_SIZE];
    int max_count[ALPHABET_SIZE];
    bool excluded[ALPHABET_SIZE];
    int rounds_applied;
    bool is_contradictory;
} knowledge_state_t;

/*
 * TYPE: candidate_array_t
 *
 * A "View" of the dictionary: an array of pointers into the master word
 * array. Candidate sets are views, so filtering never copies word data.
 */
typedef const word_t** candidate_array_t;

/*
 * FUNCTION: letter_index
 *
 * Maps 'a'..'z' to 0..25, anything else to -1.
 */
inline int letter_index(char ch)
{
    if (ch < 'a' || ch > 'z') return -1;
    return ch - 'a';
}

#endif
