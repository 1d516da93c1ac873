/*
 * FILE: knowledge_state.cpp
 *
 * WHAT:
 * Implements constraint accumulation.
 *
 * A guess such as "speed" scored P,A,P,P,A against the secret "erase" tells
 * us three separate things:
 * 1. Positional: 's' is not at 0, 'e' is not at 2 or 3.
 * 2. Counting: the secret has at least one 's' and at least two 'e's.
 * 3. Exclusion: 'p' and 'd' do not occur at all.
 * A Grey mark on a letter that ALSO scored Green/Yellow in the same guess
 * means the guess used more copies than the secret has, which pins the count
 * exactly (e.g. "geese" against "those" scores one Green 'e' and two Grey
 * 'e's, so the secret has exactly one 'e').
 */

#include "knowledge_state.h"
#include <stdio.h>
#include <string.h>

bool init_knowledge_state(knowledge_state_t* p_state, int word_length)
{
    if (p_state == NULL) return false;
    if (word_length <= 0 || word_length > MAX_WORD_LENGTH)
    {
        fprintf(stderr, "init_knowledge_state: unsupported word length %d (1..%d)\n", word_length, MAX_WORD_LENGTH);
        return false;
    }

    p_state->word_length = word_length;
    memset(p_state->green_at, 0, sizeof(p_state->green_at));
    for (int i = 0; i < ALPHABET_SIZE; i++)
    {
        p_state->yellow_exclusions[i] = 0u;
        p_state->min_count[i] = 0;
        p_state->max_count[i] = NO_MAX_COUNT;
        p_state->excluded[i] = false;
    }
    p_state->rounds_applied = 0;
    p_state->is_contradictory = false;
    return true;
}

bool update_knowledge_state(knowledge_state_t* p_state, const char* guess, const feedback_pattern_t* p_feedback)
{
    if (p_state == NULL || guess == NULL || p_feedback == NULL) return false;

    int length = p_state->word_length;
    if ((int)strlen(guess) != length || p_feedback->length != length)
    {
        fprintf(stderr, "update_knowledge_state: '%s' / %d marks do not match the session length %d\n",
            guess, p_feedback->length, length);
        return false;
    }
    for (int i = 0; i < length; i++)
    {
        if (letter_index(guess[i]) < 0)
        {
            fprintf(stderr, "update_knowledge_state: '%s' contains a non-letter at position %d\n", guess, i);
            return false;
        }
    }

    int confirmed[ALPHABET_SIZE] = { 0 };
    bool absent_seen[ALPHABET_SIZE] = { false };
    bool in_guess[ALPHABET_SIZE] = { false };

    // 1. Positional facts
    for (int i = 0; i < length; i++)
    {
        char letter = guess[i];
        int idx = letter - 'a';
        in_guess[idx] = true;

        switch (p_feedback->marks[i])
        {
        case MARK_EXACT:
            if (p_state->green_at[i] != '\0' && p_state->green_at[i] != letter) p_state->is_contradictory = true;
            if (p_state->yellow_exclusions[idx] & (1u << i)) p_state->is_contradictory = true;
            p_state->green_at[i] = letter;
            confirmed[idx]++;
            break;
        case MARK_PRESENT:
            if (p_state->green_at[i] == letter) p_state->is_contradictory = true;
            p_state->yellow_exclusions[idx] |= (1u << i);
            confirmed[idx]++;
            break;
        default:
            absent_seen[idx] = true;
            break;
        }
    }

    // 2. Counting facts, once per distinct letter of the guess
    for (int idx = 0; idx < ALPHABET_SIZE; idx++)
    {
        if (!in_guess[idx]) continue;

        if (confirmed[idx] > 0)
        {
            // An excluded letter keeps a zero count so it is never both Present and Absent.
            if (p_state->excluded[idx])
            {
                p_state->is_contradictory = true;
                continue;
            }
            if (confirmed[idx] > p_state->min_count[idx]) p_state->min_count[idx] = confirmed[idx];

            if (absent_seen[idx])
            {
                // The guess carried a surplus copy: the count is now exact.
                if (p_state->max_count[idx] != NO_MAX_COUNT && p_state->max_count[idx] != confirmed[idx])
                {
                    p_state->is_contradictory = true;
                }
                p_state->max_count[idx] = confirmed[idx];
            }
            if (p_state->max_count[idx] != NO_MAX_COUNT && p_state->min_count[idx] > p_state->max_count[idx])
            {
                p_state->is_contradictory = true;
            }
        }
        else
        {
            // Only Grey marks for this letter.
            if (p_state->min_count[idx] > 0) p_state->is_contradictory = true;
            else p_state->excluded[idx] = true;
        }
    }

    p_state->rounds_applied++;
    return true;
}

bool is_letter_confirmed(const knowledge_state_t* p_state, char letter)
{
    int idx = letter_index(letter);
    return idx >= 0 && p_state->min_count[idx] > 0;
}

bool has_max_count(const knowledge_state_t* p_state, char letter)
{
    int idx = letter_index(letter);
    return idx >= 0 && p_state->max_count[idx] != NO_MAX_COUNT;
}

void print_knowledge_state(const knowledge_state_t* p_state)
{
    printf("Pattern : ");
    for (int i = 0; i < p_state->word_length; i++)
    {
        putchar(p_state->green_at[i] != '\0' ? p_state->green_at[i] : '.');
    }
    printf("\n");

    printf("Present :");
    for (int idx = 0; idx < ALPHABET_SIZE; idx++)
    {
        if (p_state->min_count[idx] == 0) continue;

        if (p_state->max_count[idx] != NO_MAX_COUNT) printf(" %c(exactly %d", 'a' + idx, p_state->max_count[idx]);
        else printf(" %c(min %d", 'a' + idx, p_state->min_count[idx]);

        if (p_state->yellow_exclusions[idx] != 0u)
        {
            printf(", not at");
            for (int i = 0; i < p_state->word_length; i++)
            {
                if (p_state->yellow_exclusions[idx] & (1u << i)) printf(" %d", i + 1);
            }
        }
        printf(")");
    }
    printf("\n");

    printf("Absent  :");
    for (int idx = 0; idx < ALPHABET_SIZE; idx++)
    {
        if (p_state->excluded[idx]) printf(" %c", 'a' + idx);
    }
    printf("\n");

    if (p_state->is_contradictory)
    {
        printf("WARNING : the feedback history is contradictory.\n");
    }
}
