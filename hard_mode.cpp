/*
 * FILE: hard_mode.cpp
 *
 * WHAT:
 * Implements the Hard Mode rule check.
 *
 * WHY:
 * Both the Guess Selector (to shrink its pool) and the Suggest command (to
 * reject an illegal user guess) need the same answer, so the rule lives in
 * one place. Only Greens and confirmed letters are enforced.
 */

#include "hard_mode.h"
#include <string.h>

bool is_valid_hard_mode_guess(const char* guess, const knowledge_state_t* p_state)
{
    int length = p_state->word_length;
    if ((int)strlen(guess) != length) return false;

    bool guess_has_letter[ALPHABET_SIZE] = { false };
    for (int i = 0; i < length; i++)
    {
        if (p_state->green_at[i] != '\0' && guess[i] != p_state->green_at[i]) return false;

        int idx = letter_index(guess[i]);
        if (idx >= 0) guess_has_letter[idx] = true;
    }

    for (int idx = 0; idx < ALPHABET_SIZE; idx++)
    {
        if (p_state->min_count[idx] > 0 && !guess_has_letter[idx]) return false;
    }
    return true;
}
