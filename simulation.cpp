/*
 * FILE: simulation.cpp
 *
 * WHAT:
 * Implements the Simulation Engine.
 *
 * ARCHITECTURE:
 * 1. Serial Setup: Works out the opening guess once per strategy. For
 *    Minimax this is the single most expensive search of any game.
 * 2. Parallel Execution: OpenMP threads take secrets from the dictionary
 *    and play full games.
 * 3. Thread Isolation: The dictionary is shared read-only; every thread owns
 *    its knowledge state and candidate view, so games never interfere.
 * 4. Aggregation: Atomic counters for the totals, a thread-local histogram
 *    merged under a critical section at the end.
 */

#include "simulation.h"
#include "pattern_encoder.h"
#include "knowledge_state.h"
#include "candidate_filter.h"
#include "guess_selector.h"
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <omp.h>

/*
 * FUNCTION: determine_opening_word
 *
 * Runs the strategy once on a fresh state over the full dictionary.
 */
static bool determine_opening_word(const StrategyConfig* p_config,
    const word_t* p_dictionary,
    int dictionary_count,
    candidate_array_t pp_scratch,
    char* opening_word)
{
    knowledge_state_t state;
    if (!init_knowledge_state(&state, (int)strlen(p_dictionary[0].letters))) return false;

    int candidate_count = filter_dictionary(&state, p_dictionary, dictionary_count, pp_scratch);
    const word_t* p_opener = select_guess(p_config, pp_scratch, candidate_count, p_dictionary, dictionary_count, &state);
    if (p_opener == NULL) return false;

    strcpy(opening_word, p_opener->letters);
    return true;
}

bool play_simulated_game(const StrategyConfig* p_config,
    const word_t* p_dictionary,
    int dictionary_count,
    const char* secret,
    const char* opening_word,
    int max_guesses,
    candidate_array_t pp_scratch,
    int* p_guesses_taken,
    bool* p_contradiction)
{
    char current_guess[MAX_WORD_LENGTH + 1];
    knowledge_state_t state;
    feedback_pattern_t pattern;
    bool won = false;

    *p_guesses_taken = 0;
    if (p_contradiction != NULL) *p_contradiction = false;
    if (dictionary_count <= 0) return false;

    int length = (int)strlen(secret);
    if (!init_knowledge_state(&state, length)) return false;

    if (opening_word != NULL)
    {
        strcpy(current_guess, opening_word);
    }
    else if (!determine_opening_word(p_config, p_dictionary, dictionary_count, pp_scratch, current_guess))
    {
        return false;
    }

    // GAME LOOP
    for (int turn = 1; turn <= max_guesses; turn++)
    {
        *p_guesses_taken = turn;

        if (strcmp(current_guess, secret) == 0) { won = true; break; }
        if (turn == max_guesses) break;

        // Generate Feedback (Simulate the Game Engine)
        if (!encode_feedback_pattern(current_guess, secret, &pattern)) break;

        // Update Logic State and re-filter from the full dictionary
        if (!update_knowledge_state(&state, current_guess, &pattern)) break;
        int candidate_count = filter_dictionary(&state, p_dictionary, dictionary_count, pp_scratch);
        if (candidate_count == 0)
        {
            if (p_contradiction != NULL) *p_contradiction = true;
            break;
        }

        const word_t* p_next = select_guess(p_config, pp_scratch, candidate_count, p_dictionary, dictionary_count, &state);
        if (p_next == NULL) break;
        strcpy(current_guess, p_next->letters);
    }
    return won;
}

bool run_strategy_simulation(const StrategyConfig* p_config,
    const word_t* p_dictionary,
    int dictionary_count,
    int target_count,
    int max_guesses,
    bool verbose,
    SimStats* p_stats)
{
    SimStats stats;
    memset(&stats, 0, sizeof(stats));
    snprintf(stats.strategy_name, sizeof(stats.strategy_name), "%s", p_config->name);

    if (dictionary_count <= 0) { *p_stats = stats; return false; }
    if (target_count <= 0 || target_count > dictionary_count) target_count = dictionary_count;
    if (max_guesses <= 0 || max_guesses > MAX_SIMULATION_GUESSES) max_guesses = MAX_SIMULATION_GUESSES;

    if (verbose) printf(">>> Simulating Bot: %s ...\n", p_config->name);

    // --- PHASE 1: DETERMINE OPENER (Serial Step) ---
    const word_t** pp_opener_view = (const word_t**)malloc(sizeof(const word_t*) * dictionary_count);
    if (pp_opener_view == NULL)
    {
        fprintf(stderr, "Out of memory preparing the simulation!\n");
        *p_stats = stats;
        return false;
    }
    bool have_opener = determine_opening_word(p_config, p_dictionary, dictionary_count, pp_opener_view, stats.opening_word);
    free(pp_opener_view);
    if (!have_opener)
    {
        fprintf(stderr, "Strategy '%s' could not choose an opening guess.\n", p_config->name);
        *p_stats = stats;
        return false;
    }
    if (verbose) printf("    Opener: %s\n", stats.opening_word);

    // --- PHASE 2: PARALLEL SIMULATION LOOP ---
    double start_time = omp_get_wtime();
    bool allocation_failed = false;
    int wins = 0;
    int losses = 0;
    int contradictions = 0;
    long total_guesses = 0;

#pragma omp parallel
    {
        // --- THREAD LOCAL STORAGE ---
        const word_t** pp_thread_view = (const word_t**)malloc(sizeof(const word_t*) * dictionary_count);
        int local_distribution[MAX_SIMULATION_GUESSES + 1] = { 0 };

#pragma omp for schedule(dynamic)
        for (int t = 0; t < target_count; t++)
        {
            if (pp_thread_view == NULL)
            {
#pragma omp atomic write
                allocation_failed = true;
                continue;
            }

            int guesses_taken = 0;
            bool contradiction = false;
            bool won = play_simulated_game(p_config, p_dictionary, dictionary_count, p_dictionary[t].letters,
                stats.opening_word, max_guesses, pp_thread_view, &guesses_taken, &contradiction);

            if (won)
            {
#pragma omp atomic
                wins++;
#pragma omp atomic
                total_guesses += guesses_taken;
                local_distribution[guesses_taken]++;
            }
            else
            {
#pragma omp atomic
                losses++;
            }
            if (contradiction)
            {
#pragma omp atomic
                contradictions++;
            }

            // Progress Indicator (Only thread 0 prints to avoid console chaos)
            if (verbose && t % 500 == 0 && omp_get_thread_num() == 0) printf("    Progress: %d/%d (approx)\r", t, target_count);
        }

#pragma omp critical(simulation_distribution)
        {
            for (int i = 1; i <= MAX_SIMULATION_GUESSES; i++) stats.guess_distribution[i] += local_distribution[i];
        }

        free(pp_thread_view);
    }

    // --- PHASE 3: FINALIZE STATS ---
    stats.time_taken = omp_get_wtime() - start_time;
    stats.games = target_count;
    stats.wins = wins;
    stats.losses = losses;
    stats.contradictions = contradictions;
    stats.total_guesses = total_guesses;
    stats.average_guesses = (stats.wins > 0) ? (double)stats.total_guesses / stats.wins : 0.0;
    stats.win_percent = ((double)stats.wins / target_count) * 100.0;

    if (verbose) printf("    Finished. Wins: %d (%.2f%%) Avg: %.4f\n", stats.wins, stats.win_percent, stats.average_guesses);
    if (stats.contradictions > 0)
    {
        fprintf(stderr, "WARNING: %d games of '%s' ran out of candidates.\n", stats.contradictions, p_config->name);
    }

    *p_stats = stats;
    if (allocation_failed)
    {
        fprintf(stderr, "Out of memory during the simulation of '%s'!\n", p_config->name);
        return false;
    }
    return true;
}

void print_distribution(const SimStats* p_stats, int max_guesses)
{
    printf("  %s Distribution:\n", p_stats->strategy_name);
    if (p_stats->wins == 0) { printf("    N/A (0 wins)\n"); return; }

    for (int i = 1; i <= max_guesses && i <= MAX_SIMULATION_GUESSES; i++)
    {
        if (p_stats->guess_distribution[i] > 0)
        {
            double pct = 100.0 * p_stats->guess_distribution[i] / p_stats->wins;
            printf("    %2d guess%s | %5d (%6.2f%%)\n", i, (i == 1 ? "  " : "es"), p_stats->guess_distribution[i], pct);
        }
    }
    printf("\n");
}

bool run_tournament(const StrategyConfig* roster,
    int roster_size,
    const word_t* p_dictionary,
    int dictionary_count,
    int target_count,
    int max_guesses,
    bool verbose)
{
    if (roster_size <= 0 || dictionary_count <= 0) return false;
    if (target_count <= 0 || target_count > dictionary_count) target_count = dictionary_count;
    if (max_guesses <= 0 || max_guesses > MAX_SIMULATION_GUESSES) max_guesses = MAX_SIMULATION_GUESSES;

    printf("\n=============================================\n");
    printf("   STARTING STRATEGY TOURNAMENT\n");
    printf("   Targeting %d of %d words, %d guesses max\n", target_count, dictionary_count, max_guesses);
    printf("   (Parallel Processing: %d threads)\n", omp_get_max_threads());
    printf("=============================================\n\n");

    SimStats* results = (SimStats*)malloc(sizeof(SimStats) * roster_size);
    if (results == NULL)
    {
        fprintf(stderr, "Out of memory allocating tournament results!\n");
        return false;
    }

    bool all_ok = true;
    for (int i = 0; i < roster_size; ++i)
    {
        if (!run_strategy_simulation(&roster[i], p_dictionary, dictionary_count, target_count, max_guesses, verbose, &results[i]))
        {
            all_ok = false;
        }
    }

    // --- FINAL REPORT ---
    printf("\n=====================================================================================================\n");
    printf("                                      FINAL TOURNAMENT RESULTS\n");
    printf("=====================================================================================================\n");
    printf("| %-24s | %-8s | %-6s | %-6s | %-9s | %-11s | %-10s |\n", "STRATEGY", "OPENER", "WINS", "LOSSES", "WIN %", "AVG GUESSES", "TIME (s)");
    printf("|--------------------------|----------|--------|--------|-----------|-------------|------------|\n");

    int best_idx = -1;
    double best_avg = 0.0;
    double best_win = -1.0;

    for (int i = 0; i < roster_size; i++)
    {
        printf("| %-24s | %-8s | %-6d | %-6d | %8.2f%% | %11.4f | %10.2f |\n",
            results[i].strategy_name,
            results[i].opening_word,
            results[i].wins,
            results[i].losses,
            results[i].win_percent,
            results[i].average_guesses,
            results[i].time_taken);

        // Winner Logic: Highest Win % First, Lowest Average Second
        if (results[i].win_percent > best_win)
        {
            best_win = results[i].win_percent; best_idx = i; best_avg = results[i].average_guesses;
        }
        else if (results[i].win_percent == best_win && results[i].average_guesses < best_avg)
        {
            best_avg = results[i].average_guesses; best_idx = i;
        }
    }
    printf("=====================================================================================================\n");

    if (best_idx >= 0)
    {
        printf("\n*** TOURNAMENT CHAMPION: %s ***\n", results[best_idx].strategy_name);
        printf("\n--- Detailed Distribution for Champion ---\n");
        print_distribution(&results[best_idx], max_guesses);
    }

    free(results);
    return all_ok;
}
