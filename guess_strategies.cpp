/*
 * FILE: guess_strategies.cpp
 *
 * WHAT:
 * Defines the concrete solver configurations.
 *
 * THE ROSTER (5 Strategies):
 * 0. Frequency           - Most common distinct letters among the candidates.
 * 1. Frequency (Crane)   - Same, with the classic "crane" opener.
 * 2. Minimax             - Smallest worst-case bucket, any dictionary word.
 * 3. Minimax (Crane)     - Same, with the "crane" opener.
 * 4. Minimax (Hard)      - Minimax restricted to Hard Mode legal guesses.
 *
 * The Frequency strategies only ever guess candidates, which always satisfy
 * Hard Mode, so they need no separate Hard variant.
 */

#include "guess_strategies.h"
#include <stddef.h>
#include <ctype.h>

const int TOTAL_DEFINED_STRATEGIES = 5;

/*
 * CONFIGURATION ARRAY:
 * Order of fields in StrategyConfig struct:
 * 1. Name (string)
 * 2. Kind (STRATEGY_FREQUENCY / STRATEGY_MINIMAX)
 * 3. Hard Mode (bool)
 * 4. Opener Override (string or NULL)
 */
const StrategyConfig ALL_STRATEGIES[] = {
    /* 0 */ { "Frequency",         STRATEGY_FREQUENCY, false, NULL },
    /* 1 */ { "Frequency (Crane)", STRATEGY_FREQUENCY, false, "crane" },
    /* 2 */ { "Minimax",           STRATEGY_MINIMAX,   false, NULL },
    /* 3 */ { "Minimax (Crane)",   STRATEGY_MINIMAX,   false, "crane" },
    /* 4 */ { "Minimax (Hard)",    STRATEGY_MINIMAX,   true,  NULL }
};

static bool names_match(const char* a, const char* b)
{
    while (*a != '\0' && *b != '\0')
    {
        if (tolower((unsigned char)*a) != tolower((unsigned char)*b)) return false;
        a++; b++;
    }
    return *a == *b;
}

const StrategyConfig* find_strategy_by_name(const char* name)
{
    if (name == NULL) return NULL;
    for (int i = 0; i < TOTAL_DEFINED_STRATEGIES; i++)
    {
        if (names_match(ALL_STRATEGIES[i].name, name)) return &ALL_STRATEGIES[i];
    }
    return NULL;
}
