/*
 * FILE: candidate_filter.cpp
 *
 * WHAT:
 * Implements the consistency check and the two filtering entry points.
 *
 * The check runs cheapest-first: positional tests (greens, yellow
 * exclusions, excluded letters) reject most words while the letter
 * histogram is being built, and the count bounds are only compared once the
 * histogram is complete.
 */

#include "candidate_filter.h"
#include <string.h>

bool is_candidate_consistent(const knowledge_state_t* p_state, const char* word)
{
    if (p_state->is_contradictory) return false;

    int length = p_state->word_length;
    int word_counts[ALPHABET_SIZE] = { 0 };

    for (int i = 0; i < length; i++)
    {
        char ch = word[i];
        int idx = letter_index(ch);
        if (idx < 0) return false; // Includes a premature terminator (word too short)

        // 1. Green: the letter is pinned here
        if (p_state->green_at[i] != '\0' && p_state->green_at[i] != ch) return false;

        // 2. Grey: the letter is not in the secret at all
        if (p_state->excluded[idx]) return false;

        // 3. Yellow: the letter was seen here and was not Green
        if (p_state->yellow_exclusions[idx] & (1u << i)) return false;

        word_counts[idx]++;
    }
    if (word[length] != '\0') return false; // Word too long

    // 4. Count bounds
    for (int idx = 0; idx < ALPHABET_SIZE; idx++)
    {
        if (word_counts[idx] < p_state->min_count[idx]) return false;
        if (p_state->max_count[idx] != NO_MAX_COUNT && word_counts[idx] != p_state->max_count[idx]) return false;
    }
    return true;
}

int filter_dictionary(const knowledge_state_t* p_state,
    const word_t* p_dictionary,
    int dictionary_count,
    candidate_array_t pp_candidates)
{
    int candidate_count = 0;
    for (int i = 0; i < dictionary_count; ++i)
    {
        if (is_candidate_consistent(p_state, p_dictionary[i].letters))
        {
            pp_candidates[candidate_count++] = &p_dictionary[i];
        }
    }
    return candidate_count;
}

int filter_candidates(const knowledge_state_t* p_state,
    const word_t* const* pp_in,
    int in_count,
    candidate_array_t pp_out)
{
    int out_count = 0;
    for (int i = 0; i < in_count; ++i)
    {
        const word_t* p_word = pp_in[i];
        if (is_candidate_consistent(p_state, p_word->letters))
        {
            pp_out[out_count++] = p_word;
        }
    }
    return out_count;
}
