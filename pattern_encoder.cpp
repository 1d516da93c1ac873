/*
 * FILE: pattern_encoder.cpp
 *
 * WHAT:
 * Implements the feedback colouring rules.
 *
 * LOGIC:
 * 1. First Pass (Greens): Mark exact matches. Letters of the answer that
 *    were matched exactly are never offered to the second pass.
 * 2. Second Pass (Yellows): Left to right over the non-green positions,
 *    mark a letter Yellow while the answer still has an unclaimed copy of it.
 *
 * The order of the passes matters for duplicate letters: guessing "speed"
 * against "abide" yields a single Yellow 'e', and guessing "speed" against
 * "erase" can never report more than two 'e' marks.
 */

#include "pattern_encoder.h"
#include <stdio.h>
#include <string.h>

/*
 * FUNCTION: encode_feedback_pattern
 */
bool encode_feedback_pattern(const char* guess, const char* answer, feedback_pattern_t* p_pattern)
{
    if (guess == NULL || answer == NULL || p_pattern == NULL) return false;

    size_t guess_length = strlen(guess);
    size_t answer_length = strlen(answer);
    if (guess_length != answer_length || guess_length == 0 || guess_length > (size_t)MAX_WORD_LENGTH)
    {
        fprintf(stderr, "encode_feedback_pattern: length mismatch ('%s' has %d letters, '%s' has %d)\n",
            guess, (int)guess_length, answer, (int)answer_length);
        return false;
    }

    int length = (int)guess_length;
    int answer_char_counts[ALPHABET_SIZE] = { 0 };

    p_pattern->length = length;

    // 1. First Pass: Greens
    for (int i = 0; i < length; i++)
    {
        if (guess[i] == answer[i])
        {
            p_pattern->marks[i] = MARK_EXACT;
        }
        else
        {
            p_pattern->marks[i] = MARK_ABSENT;
            int idx = letter_index(answer[i]);
            if (idx >= 0) answer_char_counts[idx]++;
        }
    }

    // 2. Second Pass: Yellows
    for (int i = 0; i < length; i++)
    {
        if (p_pattern->marks[i] == MARK_EXACT) continue;

        int idx = letter_index(guess[i]);
        if (idx >= 0 && answer_char_counts[idx] > 0)
        {
            p_pattern->marks[i] = MARK_PRESENT;
            answer_char_counts[idx]--;
        }
    }
    return true;
}

/*
 * FUNCTION: compute_pattern_index
 *
 * WHAT:
 * Integer form of the two-pass rule. The states array lives on the stack and
 * the answer letter histogram is 26 ints, so there is no allocation here.
 */
int compute_pattern_index(const char* guess, const char* answer, int length)
{
    int states[MAX_WORD_LENGTH];
    int answer_char_counts[ALPHABET_SIZE] = { 0 };

    // 1. Greens
    for (int i = 0; i < length; i++)
    {
        if (guess[i] == answer[i])
        {
            states[i] = MARK_EXACT;
        }
        else
        {
            states[i] = MARK_ABSENT;
            answer_char_counts[answer[i] - 'a']++;
        }
    }

    // 2. Yellows
    for (int i = 0; i < length; i++)
    {
        if (states[i] != MARK_EXACT)
        {
            int letter = guess[i] - 'a';
            if (answer_char_counts[letter] > 0)
            {
                states[i] = MARK_PRESENT;
                answer_char_counts[letter]--;
            }
        }
    }

    // 3. Base-3 encode, position 0 is the least significant digit
    int index = 0;
    int multiplier = 1;
    for (int i = 0; i < length; i++)
    {
        index += states[i] * multiplier;
        multiplier *= 3;
    }
    return index;
}

int pattern_space_size(int length)
{
    int size = 1;
    for (int i = 0; i < length; i++) size *= 3;
    return size;
}

int solved_pattern_index(int length)
{
    return pattern_space_size(length) - 1;
}

int pattern_to_index(const feedback_pattern_t* p_pattern)
{
    int index = 0;
    int multiplier = 1;
    for (int i = 0; i < p_pattern->length; i++)
    {
        index += p_pattern->marks[i] * multiplier;
        multiplier *= 3;
    }
    return index;
}

void pattern_from_index(int index, int length, feedback_pattern_t* p_pattern)
{
    p_pattern->length = length;
    for (int i = 0; i < length; i++)
    {
        p_pattern->marks[i] = (unsigned char)(index % 3);
        index /= 3;
    }
}

bool is_solved_pattern(const feedback_pattern_t* p_pattern)
{
    if (p_pattern->length <= 0) return false;
    for (int i = 0; i < p_pattern->length; i++)
    {
        if (p_pattern->marks[i] != MARK_EXACT) return false;
    }
    return true;
}

int count_marks(const feedback_pattern_t* p_pattern, feedback_mark_t mark)
{
    int count = 0;
    for (int i = 0; i < p_pattern->length; i++)
    {
        if (p_pattern->marks[i] == mark) count++;
    }
    return count;
}
