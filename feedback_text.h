/*
 * FILE: feedback_text.h
 *
 * WHAT:
 * Converts between the textual feedback a user types (e.g. "bgybb",
 * "--g-g", "02002") and the engine's feedback_pattern_t.
 *
 * WHY:
 * The engine only understands EXACT/PRESENT/ABSENT. Which characters a human
 * may use to say "green" is a shell decision, kept here so the engine never
 * sees malformed feedback.
 *
 * ACCEPTED TOKENS (case-insensitive):
 * - EXACT   : 'G', '2'
 * - PRESENT : 'Y', '1'
 * - ABSENT  : 'B', 'X', '-', '.', '0'
 */

#pragma once
#ifndef FEEDBACK_TEXT_H
#define FEEDBACK_TEXT_H
#include "solver_types.h"

/*
 * FUNCTION: parse_feedback_text
 *
 * RETURNS:
 * - true if `text` has exactly `word_length` valid tokens.
 * - false otherwise (a message naming the bad character is printed).
 */
bool parse_feedback_text(const char* text, int word_length, feedback_pattern_t* p_pattern);

/*
 * FUNCTION: format_feedback_pattern
 *
 * Writes the pattern as 'G'/'Y'/'B' characters into `buffer`
 * (capacity >= MAX_WORD_LENGTH + 1).
 */
void format_feedback_pattern(const feedback_pattern_t* p_pattern, char* buffer);

/*
 * FUNCTION: normalize_guess_text
 *
 * Lower-cases `text` into `buffer` (capacity >= MAX_WORD_LENGTH + 1).
 * Returns false if it is not 1..MAX_WORD_LENGTH letters.
 */
bool normalize_guess_text(const char* text, char* buffer);

#endif
