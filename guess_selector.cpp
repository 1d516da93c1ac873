/*
 * FILE: guess_selector.cpp
 *
 * WHAT:
 * Implements the two selection algorithms and the strategy dispatch.
 *
 * KEY OPTIMIZATIONS (Minimax):
 * 1. Integer Encoding: patterns are base-3 integers, so a bucket is just a
 *    histogram slot (`bins[idx]++`).
 * 2. Thread Scratch: every thread allocates its histogram and pattern list
 *    ONCE per call and resets only the slots it touched, so the inner loop
 *    never allocates.
 * 3. Pruning: a guess is abandoned as soon as one of its buckets grows past
 *    the best worst-case the thread has already found.
 * 4. OpenMP Parallelism: the pool is split across threads with dynamic
 *    scheduling; thread-local winners are merged under a critical section
 *    with a total order, which keeps the answer deterministic.
 *
 * WHY:
 * Minimax is O(|pool| x |candidates| x L) per round. With a 15,000 word
 * dictionary the first round is over a billion letter comparisons.
 */

#include "guess_selector.h"
#include "pattern_encoder.h"
#include "hard_mode.h"
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <limits.h>
#include <omp.h>

/*
 * STRUCT: guess_request_t
 *
 * The common argument block handed to every strategy implementation.
 */
typedef struct _guess_request
{
    const word_t* const* pp_candidates;
    int candidate_count;
    const word_t* const* pp_pool;
    int pool_count;
} guess_request_t;

typedef const word_t* (*guess_select_fn)(const guess_request_t* p_request);

// --- FREQUENCY HEURISTIC ---

const word_t* select_frequency_guess(const word_t* const* pp_candidates, int candidate_count)
{
    if (candidate_count <= 0) return NULL;
    if (candidate_count == 1) return pp_candidates[0];

    // 1. How many candidates contain each letter (at most once per candidate)
    int letter_frequency[ALPHABET_SIZE] = { 0 };
    for (int i = 0; i < candidate_count; i++)
    {
        bool seen[ALPHABET_SIZE] = { false };
        for (const char* p = pp_candidates[i]->letters; *p != '\0'; p++)
        {
            int idx = letter_index(*p);
            if (idx >= 0 && !seen[idx])
            {
                seen[idx] = true;
                letter_frequency[idx]++;
            }
        }
    }

    // 2. Score each candidate by its distinct letters
    const word_t* best_word = NULL;
    long best_score = -1;
    for (int i = 0; i < candidate_count; i++)
    {
        bool seen[ALPHABET_SIZE] = { false };
        long score = 0;
        for (const char* p = pp_candidates[i]->letters; *p != '\0'; p++)
        {
            int idx = letter_index(*p);
            if (idx >= 0 && !seen[idx])
            {
                seen[idx] = true;
                score += letter_frequency[idx];
            }
        }
        if (score > best_score)
        {
            best_score = score;
            best_word = pp_candidates[i];
        }
    }
    return best_word;
}

// --- MINIMAX SEARCH ---

static int compare_ints(const void* p1, const void* p2)
{
    int a = *(const int*)p1;
    int b = *(const int*)p2;
    return (a > b) - (a < b);
}

/*
 * FUNCTION: measure_worst_bucket
 *
 * WHAT:
 * Partitions the candidates by the pattern `guess` receives and returns the
 * largest bucket size. Sets *p_is_candidate when some candidate answers with
 * the all-EXACT pattern, i.e. the guess is itself a candidate.
 *
 * With a dense histogram (`bins` != NULL, all zero on entry, all zero on exit)
 * the scan stops as soon as a bucket exceeds `cutoff`; the returned value is
 * then only known to be > cutoff. Without one, the pattern indices are sorted
 * and counted in runs.
 */
static int measure_worst_bucket(const char* guess,
    const word_t* const* pp_candidates,
    int candidate_count,
    int length,
    int* codes,
    int* bins,
    int cutoff,
    bool* p_is_candidate)
{
    int solved_idx = solved_pattern_index(length);
    int worst = 0;
    *p_is_candidate = false;

    if (bins != NULL)
    {
        int touched = 0;
        for (int c = 0; c < candidate_count; c++)
        {
            int idx = compute_pattern_index(guess, pp_candidates[c]->letters, length);
            codes[touched++] = idx;
            if (idx == solved_idx) *p_is_candidate = true;

            int size = ++bins[idx];
            if (size > worst)
            {
                worst = size;
                if (worst > cutoff) break;
            }
        }
        for (int k = 0; k < touched; k++) bins[codes[k]] = 0;
        return worst;
    }

    for (int c = 0; c < candidate_count; c++)
    {
        codes[c] = compute_pattern_index(guess, pp_candidates[c]->letters, length);
        if (codes[c] == solved_idx) *p_is_candidate = true;
    }
    qsort(codes, candidate_count, sizeof(int), compare_ints);

    int run = 0;
    for (int c = 0; c < candidate_count; c++)
    {
        run = (c > 0 && codes[c] == codes[c - 1]) ? run + 1 : 1;
        if (run > worst) worst = run;
    }
    return worst;
}

/*
 * FUNCTION: is_better_minimax_choice
 *
 * Total order used by every thread and by the final merge:
 * smaller worst case, then "is a candidate", then earlier pool position.
 */
static bool is_better_minimax_choice(int worst, bool is_candidate, int index,
    int best_worst, bool best_is_candidate, int best_index)
{
    if (best_index < 0) return true;
    if (worst != best_worst) return worst < best_worst;
    if (is_candidate != best_is_candidate) return is_candidate;
    return index < best_index;
}

int compute_worst_case_bucket(const char* guess, const word_t* const* pp_candidates, int candidate_count)
{
    if (candidate_count <= 0) return 0;

    int length = (int)strlen(guess);
    int* codes = (int*)malloc(sizeof(int) * candidate_count);
    int* bins = NULL;
    if (length <= MAX_DENSE_PATTERN_LENGTH) bins = (int*)calloc(pattern_space_size(length), sizeof(int));

    if (codes == NULL || (length <= MAX_DENSE_PATTERN_LENGTH && bins == NULL))
    {
        fprintf(stderr, "compute_worst_case_bucket: out of memory\n");
        free(codes); free(bins);
        return -1;
    }

    bool is_candidate = false;
    int worst = measure_worst_bucket(guess, pp_candidates, candidate_count, length, codes, bins, INT_MAX, &is_candidate);

    free(codes);
    free(bins);
    return worst;
}

const word_t* select_minimax_guess(const word_t* const* pp_candidates,
    int candidate_count,
    const word_t* const* pp_pool,
    int pool_count,
    int* p_worst_case)
{
    if (candidate_count <= 0) return NULL;

    // Endgame: with the answer nearly certain, only guess the answer itself.
    if (candidate_count <= MINIMAX_NARROW_THRESHOLD || pool_count <= 0)
    {
        pp_pool = pp_candidates;
        pool_count = candidate_count;
    }

    int length = (int)strlen(pp_candidates[0]->letters);
    bool use_dense = (length <= MAX_DENSE_PATTERN_LENGTH);
    int space = use_dense ? pattern_space_size(length) : 0;

    int best_worst = INT_MAX;
    bool best_is_candidate = false;
    int best_index = -1;
    bool allocation_failed = false;

#pragma omp parallel
    {
        // --- THREAD LOCAL SCRATCH ---
        int* codes = (int*)malloc(sizeof(int) * candidate_count);
        int* bins = use_dense ? (int*)calloc(space, sizeof(int)) : NULL;
        bool scratch_ok = (codes != NULL && (!use_dense || bins != NULL));

        int local_worst = INT_MAX;
        bool local_is_candidate = false;
        int local_index = -1;

        // Every thread must reach the work-sharing loop, even without scratch.
#pragma omp for schedule(dynamic, 16)
        for (int g = 0; g < pool_count; g++)
        {
            if (!scratch_ok)
            {
#pragma omp atomic write
                allocation_failed = true;
                continue;
            }

            bool is_candidate = false;
            int worst = measure_worst_bucket(pp_pool[g]->letters, pp_candidates, candidate_count,
                length, codes, bins, local_worst, &is_candidate);

            if (worst > local_worst) continue; // Pruned, or simply worse

            if (is_better_minimax_choice(worst, is_candidate, g, local_worst, local_is_candidate, local_index))
            {
                local_worst = worst;
                local_is_candidate = is_candidate;
                local_index = g;
            }
        }

        // Merge this thread's winner into the global result
#pragma omp critical(minimax_best)
        {
            if (local_index >= 0 &&
                is_better_minimax_choice(local_worst, local_is_candidate, local_index, best_worst, best_is_candidate, best_index))
            {
                best_worst = local_worst;
                best_is_candidate = local_is_candidate;
                best_index = local_index;
            }
        }

        free(codes);
        free(bins);
    }

    if (allocation_failed)
    {
        fprintf(stderr, "select_minimax_guess: out of memory for %d candidates\n", candidate_count);
        return NULL;
    }
    if (best_index < 0) return NULL;

    if (p_worst_case != NULL) *p_worst_case = best_worst;
    return pp_pool[best_index];
}

// --- STRATEGY DISPATCH ---

static const word_t* run_frequency_strategy(const guess_request_t* p_request)
{
    return select_frequency_guess(p_request->pp_candidates, p_request->candidate_count);
}

static const word_t* run_minimax_strategy(const guess_request_t* p_request)
{
    return select_minimax_guess(p_request->pp_candidates, p_request->candidate_count,
        p_request->pp_pool, p_request->pool_count, NULL);
}

// Indexed by strategy_kind_t
static const guess_select_fn STRATEGY_TABLE[STRATEGY_KIND_COUNT] = {
    run_frequency_strategy,
    run_minimax_strategy
};

/*
 * FUNCTION: find_opener
 *
 * Looks the configured opener up in the dictionary, so the returned pointer
 * has the same lifetime as every other recommendation.
 */
static const word_t* find_opener(const char* opener, const word_t* p_dictionary, int dictionary_count, int length)
{
    if ((int)strlen(opener) != length) return NULL;
    for (int i = 0; i < dictionary_count; i++)
    {
        if (strcmp(p_dictionary[i].letters, opener) == 0) return &p_dictionary[i];
    }
    return NULL;
}

const word_t* select_guess(const StrategyConfig* p_config,
    const word_t* const* pp_candidates,
    int candidate_count,
    const word_t* p_dictionary,
    int dictionary_count,
    const knowledge_state_t* p_state)
{
    if (p_config == NULL || p_state == NULL) return NULL;
    if (candidate_count <= 0) return NULL;
    if (p_config->kind < 0 || p_config->kind >= STRATEGY_KIND_COUNT)
    {
        fprintf(stderr, "select_guess: strategy '%s' has an unknown kind %d\n", p_config->name, (int)p_config->kind);
        return NULL;
    }

    // 1. Opener override (first round only)
    if (p_config->opener_override_word != NULL && p_state->rounds_applied == 0)
    {
        const word_t* p_opener = find_opener(p_config->opener_override_word, p_dictionary, dictionary_count, p_state->word_length);
        if (p_opener != NULL) return p_opener;
    }

    // 2. Guess pool: the dictionary, minus Hard Mode violations if required
    const word_t** pp_pool = (const word_t**)malloc(sizeof(const word_t*) * (dictionary_count > 0 ? dictionary_count : 1));
    if (pp_pool == NULL)
    {
        fprintf(stderr, "select_guess: out of memory building the guess pool\n");
        return NULL;
    }

    int pool_count = 0;
    for (int i = 0; i < dictionary_count; i++)
    {
        if (p_config->hard_mode && !is_valid_hard_mode_guess(p_dictionary[i].letters, p_state)) continue;
        pp_pool[pool_count++] = &p_dictionary[i];
    }

    // 3. Dispatch
    guess_request_t request;
    request.pp_candidates = pp_candidates;
    request.candidate_count = candidate_count;
    request.pp_pool = pp_pool;
    request.pool_count = pool_count;

    const word_t* p_choice = STRATEGY_TABLE[p_config->kind](&request);

    free(pp_pool);
    return p_choice;
}
