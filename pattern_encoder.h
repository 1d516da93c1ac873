/*
 * FILE: pattern_encoder.h
 *
 * WHAT:
 * Defines the interface for generating feedback patterns (Green/Yellow/Grey)
 * for a guess against a hypothetical answer, in both a readable structured
 * form and a compact integer form.
 *
 * WHY:
 * This is the "Referee" component. It knows nothing about strategy or game
 * state; it only applies the colouring rules. The Knowledge State consumes
 * its output alphabet, and the Guess Selector calls it millions of times per
 * round when partitioning candidates.
 */

#pragma once
#ifndef PATTERN_ENCODER_H
#define PATTERN_ENCODER_H
#include "solver_types.h"

/*
 * FUNCTION: encode_feedback_pattern
 *
 * WHAT:
 * Fills `p_pattern` with the feedback `guess` would receive if `answer` were
 * the secret. Both words must have the same length (1..MAX_WORD_LENGTH).
 *
 * RETURNS:
 * - true on success.
 * - false if the lengths differ or are out of range (nothing is truncated).
 */
bool encode_feedback_pattern(const char* guess, const char* answer, feedback_pattern_t* p_pattern);

/*
 * FUNCTION: compute_pattern_index
 *
 * WHAT:
 * Same rules as `encode_feedback_pattern`, but returns the base-3 integer
 * index of the pattern (ABSENT=0, PRESENT=1, EXACT=2, position 0 is the least
 * significant digit). The caller guarantees both words have `length` letters.
 *
 * WHY:
 * Used in the inner loop of the Minimax search: no string handling, no
 * allocation, and the result can index a histogram directly.
 */
int compute_pattern_index(const char* guess, const char* answer, int length);

/*
 * FUNCTION: pattern_space_size
 *
 * Number of distinct pattern indices for words of `length` letters (3^length).
 */
int pattern_space_size(int length);

/*
 * FUNCTION: solved_pattern_index
 *
 * The index of the all-EXACT pattern (3^length - 1).
 */
int solved_pattern_index(int length);

/*
 * FUNCTIONS: Pattern conversions
 */
int pattern_to_index(const feedback_pattern_t* p_pattern);
void pattern_from_index(int index, int length, feedback_pattern_t* p_pattern);

/*
 * FUNCTION: is_solved_pattern
 *
 * True if every mark is EXACT.
 */
bool is_solved_pattern(const feedback_pattern_t* p_pattern);

/*
 * FUNCTION: count_marks
 *
 * Counts how many positions of the pattern carry `mark`.
 */
int count_marks(const feedback_pattern_t* p_pattern, feedback_mark_t mark);

#endif
