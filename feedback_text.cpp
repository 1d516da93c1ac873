/*
 * FILE: feedback_text.cpp
 *
 * WHAT:
 * Implements the feedback text codec and guess normalisation.
 *
 * WHY:
 * Users type feedback in several dialects (letters, digits, dashes). Every
 * character is checked here and a readable error names the bad one, so a
 * typo never reaches the engine as a wrong mark.
 */

#include "feedback_text.h"
#include <stdio.h>
#include <string.h>
#include <ctype.h>

bool parse_feedback_text(const char* text, int word_length, feedback_pattern_t* p_pattern)
{
    size_t len = strlen(text);
    if ((int)len != word_length || word_length > MAX_WORD_LENGTH)
    {
        fprintf(stderr, "The result pattern '%s' must be exactly %d characters long.\n", text, word_length);
        return false;
    }

    p_pattern->length = word_length;
    for (int i = 0; i < word_length; i++)
    {
        switch (toupper((unsigned char)text[i]))
        {
        case 'G': case '2':
            p_pattern->marks[i] = MARK_EXACT;
            break;
        case 'Y': case '1':
            p_pattern->marks[i] = MARK_PRESENT;
            break;
        case 'B': case 'X': case '-': case '.': case '0':
            p_pattern->marks[i] = MARK_ABSENT;
            break;
        default:
            fprintf(stderr, "Invalid character '%c' in result '%s'. Use G, Y or B (or -).\n", text[i], text);
            return false;
        }
    }
    return true;
}

void format_feedback_pattern(const feedback_pattern_t* p_pattern, char* buffer)
{
    static const char symbols[] = { 'B', 'Y', 'G' };
    int i = 0;
    for (; i < p_pattern->length && i < MAX_WORD_LENGTH; i++)
    {
        buffer[i] = (p_pattern->marks[i] <= MARK_EXACT) ? symbols[p_pattern->marks[i]] : '?';
    }
    buffer[i] = '\0';
}

bool normalize_guess_text(const char* text, char* buffer)
{
    size_t len = strlen(text);
    if (len == 0 || len > (size_t)MAX_WORD_LENGTH) return false;

    for (size_t i = 0; i < len; i++)
    {
        unsigned char ch = (unsigned char)text[i];
        if (!isalpha(ch) || ch > 127) return false;
        buffer[i] = (char)tolower(ch);
    }
    buffer[len] = '\0';
    return true;
}
