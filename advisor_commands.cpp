/*
 * FILE: advisor_commands.cpp
 *
 * WHAT:
 * Implements the command-line shell.
 *
 * FLOW (suggest):
 * 1. Every "guess=feedback" pair is validated and replayed in order.
 * 2. The dictionary is filtered against the accumulated knowledge.
 * 3. The survivors, the knowledge summary and the next guess are printed.
 *
 * The shell never prompts; everything comes from argv.
 */

#include "advisor_commands.h"
#include "word_source.h"
#include "feedback_text.h"
#include "pattern_encoder.h"
#include "candidate_filter.h"
#include "hard_mode.h"
#include "guess_strategies.h"
#include "guess_selector.h"
#include "simulation.h"
#include <stdlib.h>
#include <string.h>

void print_usage(FILE* fpOut)
{
    fprintf(fpOut,
        "Usage:\n"
        "  wordle_advisor suggest  --dict SRC [--length L] [--strategy NAME] [--hard]\n"
        "                          [--show N] [--quiet] [guess=feedback ...]\n"
        "  wordle_advisor simulate --dict SRC [--length L] [--strategy NAME ...] [--hard]\n"
        "                          [--max-guesses N] [--limit N] [--quiet]\n"
        "  wordle_advisor --help\n"
        "\n"
        "SRC is a word list file (one word per line) or an http(s) URL.\n"
        "Feedback uses one character per letter: G or 2 = green, Y or 1 = yellow,\n"
        "B, X, -, . or 0 = grey. Example: crane=bbgbg\n"
        "\n"
        "Strategies:\n");
    for (int i = 0; i < TOTAL_DEFINED_STRATEGIES; i++)
    {
        fprintf(fpOut, "  %s\n", ALL_STRATEGIES[i].name);
    }
}

/*
 * FUNCTION: parse_int_option
 *
 * WHAT:
 * Converts the value of a numeric option, rejecting trailing garbage and
 * values below `min_value`.
 */
static bool parse_int_option(const char* option, const char* text, int min_value, int* p_value)
{
    char* p_end = NULL;
    long value = strtol(text, &p_end, 10);
    if (p_end == text || *p_end != '\0' || value < min_value || value > 1000000)
    {
        fprintf(stderr, "Invalid value '%s' for %s.\n", text, option);
        return false;
    }
    *p_value = (int)value;
    return true;
}

bool parse_command_line(int argc, const char* const argv[], command_options_t* p_options)
{
    memset(p_options, 0, sizeof(*p_options));
    p_options->word_length = DEFAULT_WORD_LENGTH;
    p_options->show_count = DEFAULT_SHOW_COUNT;
    p_options->max_guesses = DEFAULT_MAX_GUESSES;

    for (int i = 1; i < argc; i++)
    {
        const char* arg = argv[i];

        // Flags without a value
        if (strcmp(arg, "--help") == 0 || strcmp(arg, "-h") == 0) { p_options->show_help = true; continue; }
        if (strcmp(arg, "--hard") == 0) { p_options->hard_mode = true; continue; }
        if (strcmp(arg, "--quiet") == 0) { p_options->quiet = true; continue; }

        if (strncmp(arg, "--", 2) == 0)
        {
            if (i + 1 >= argc)
            {
                fprintf(stderr, "Option %s needs a value.\n", arg);
                return false;
            }
            const char* value = argv[++i];

            if (strcmp(arg, "--dict") == 0) p_options->dictionary_source = value;
            else if (strcmp(arg, "--length") == 0)
            {
                if (!parse_int_option(arg, value, 1, &p_options->word_length)) return false;
                if (p_options->word_length > MAX_WORD_LENGTH)
                {
                    fprintf(stderr, "Word length %d is not supported (1..%d).\n", p_options->word_length, MAX_WORD_LENGTH);
                    return false;
                }
            }
            else if (strcmp(arg, "--show") == 0) { if (!parse_int_option(arg, value, 0, &p_options->show_count)) return false; }
            else if (strcmp(arg, "--max-guesses") == 0)
            {
                if (!parse_int_option(arg, value, 1, &p_options->max_guesses)) return false;
                if (p_options->max_guesses > MAX_SIMULATION_GUESSES)
                {
                    fprintf(stderr, "--max-guesses cannot exceed %d.\n", MAX_SIMULATION_GUESSES);
                    return false;
                }
            }
            else if (strcmp(arg, "--limit") == 0) { if (!parse_int_option(arg, value, 1, &p_options->limit)) return false; }
            else if (strcmp(arg, "--strategy") == 0)
            {
                if (p_options->strategy_name_count == MAX_ROSTER_SIZE)
                {
                    fprintf(stderr, "Too many --strategy options (max %d).\n", MAX_ROSTER_SIZE);
                    return false;
                }
                p_options->strategy_names[p_options->strategy_name_count++] = value;
            }
            else
            {
                fprintf(stderr, "Unknown option '%s'.\n", arg);
                return false;
            }
            continue;
        }

        // Positional arguments
        if (p_options->command == NULL) { p_options->command = arg; continue; }
        if (p_options->pair_count == MAX_FEEDBACK_PAIRS)
        {
            fprintf(stderr, "Too many guess=feedback pairs (max %d).\n", MAX_FEEDBACK_PAIRS);
            return false;
        }
        p_options->pairs[p_options->pair_count++] = arg;
    }
    return true;
}

/*
 * FUNCTION: resolve_strategy
 *
 * Looks up `name` and copies it into `p_config`, forcing hard mode when the
 * command line asked for it.
 */
static bool resolve_strategy(const char* name, bool force_hard_mode, StrategyConfig* p_config)
{
    const StrategyConfig* p_found = find_strategy_by_name(name);
    if (p_found == NULL)
    {
        fprintf(stderr, "Unknown strategy '%s'. Run with --help for the list.\n", name);
        return false;
    }
    *p_config = *p_found;
    if (force_hard_mode) p_config->hard_mode = true;
    return true;
}

int apply_feedback_pair(const char* pair,
    const word_t* p_dictionary,
    int dictionary_count,
    bool hard_mode,
    knowledge_state_t* p_state,
    char* guess,
    bool* p_solved)
{
    char guess_text[64];
    feedback_pattern_t pattern;

    *p_solved = false;

    const char* p_separator = strchr(pair, '=');
    size_t guess_len = (p_separator != NULL) ? (size_t)(p_separator - pair) : 0;
    if (p_separator == NULL || guess_len == 0 || guess_len >= sizeof(guess_text))
    {
        fprintf(stderr, "Expected guess=feedback, got '%s'.\n", pair);
        return EXIT_MALFORMED_INPUT;
    }
    memcpy(guess_text, pair, guess_len);
    guess_text[guess_len] = '\0';

    if (!normalize_guess_text(guess_text, guess) || (int)strlen(guess) != p_state->word_length)
    {
        fprintf(stderr, "Guess '%s' must be exactly %d letters.\n", guess_text, p_state->word_length);
        return EXIT_MALFORMED_INPUT;
    }
    if (find_dictionary_word(p_dictionary, dictionary_count, guess) == NULL)
    {
        fprintf(stderr, "Guess '%s' is not in the word list.\n", guess);
        return EXIT_MALFORMED_INPUT;
    }
    if (hard_mode && !is_valid_hard_mode_guess(guess, p_state))
    {
        fprintf(stderr, "Guess '%s' is not allowed in hard mode: it ignores a revealed hint.\n", guess);
        return EXIT_HARD_MODE_VIOLATION;
    }
    if (!parse_feedback_text(p_separator + 1, p_state->word_length, &pattern)) return EXIT_MALFORMED_INPUT;

    if (is_solved_pattern(&pattern))
    {
        *p_solved = true;
        return 0;
    }

    if (!update_knowledge_state(p_state, guess, &pattern)) return EXIT_MALFORMED_INPUT;
    return 0;
}

int run_suggest_command(const command_options_t* p_options, const word_t* p_dictionary, int dictionary_count)
{
    StrategyConfig config;
    knowledge_state_t state;

    const char* strategy_name = (p_options->strategy_name_count > 0) ? p_options->strategy_names[0] : DEFAULT_STRATEGY_NAME;
    if (p_options->strategy_name_count > 1)
    {
        fprintf(stderr, "suggest takes a single --strategy.\n");
        return EXIT_MALFORMED_INPUT;
    }
    if (!resolve_strategy(strategy_name, p_options->hard_mode, &config)) return EXIT_MALFORMED_INPUT;
    if (!init_knowledge_state(&state, p_options->word_length)) return EXIT_MALFORMED_INPUT;

    // 1. Replay the history
    for (int i = 0; i < p_options->pair_count; i++)
    {
        char guess[MAX_WORD_LENGTH + 1];
        bool solved = false;
        int status = apply_feedback_pair(p_options->pairs[i], p_dictionary, dictionary_count, config.hard_mode, &state, guess, &solved);
        if (status != 0) return status;

        if (solved)
        {
            printf("\n*** SOLVED: '%s' in %d guess%s! ***\n", guess, i + 1, (i == 0) ? "" : "es");
            return 0;
        }
    }

    // 2. Filter
    const word_t** pp_candidates = (const word_t**)malloc(sizeof(const word_t*) * dictionary_count);
    if (pp_candidates == NULL)
    {
        fprintf(stderr, "Out of memory allocating the candidate list!\n");
        return EXIT_MALFORMED_INPUT;
    }
    int candidate_count = filter_dictionary(&state, p_dictionary, dictionary_count, pp_candidates);

    printf("Strategy: %s%s\n", config.name, config.hard_mode ? " [hard mode]" : "");
    printf("Remaining valid words: %d\n", candidate_count);
    if (candidate_count == 0)
    {
        printf("CRITICAL: No words remaining! Check the feedback you entered.\n");
        free(pp_candidates);
        return EXIT_NO_CANDIDATES;
    }

    // 3. Report
    int shown = (candidate_count < p_options->show_count) ? candidate_count : p_options->show_count;
    for (int i = 0; i < shown; i++)
    {
        printf("%s%s", pp_candidates[i]->letters, (i + 1 == shown) ? "\n" : ", ");
    }
    if (shown < candidate_count) printf("... and %d more\n", candidate_count - shown);

    printf("\n");
    print_knowledge_state(&state);

    const word_t* p_pick = select_guess(&config, pp_candidates, candidate_count, p_dictionary, dictionary_count, &state);
    if (p_pick == NULL)
    {
        fprintf(stderr, "No guess could be selected.\n");
        free(pp_candidates);
        return EXIT_MALFORMED_INPUT;
    }

    if (candidate_count == 1) printf("\n>>> THE ANSWER IS: %s <<<\n", p_pick->letters);
    else printf("\n>>> RECOMMENDED GUESS: %s <<<\n", p_pick->letters);

    free(pp_candidates);
    return 0;
}

int run_simulate_command(const command_options_t* p_options, const word_t* p_dictionary, int dictionary_count)
{
    StrategyConfig roster[MAX_ROSTER_SIZE];
    int roster_size = 0;

    if (p_options->pair_count > 0)
    {
        fprintf(stderr, "simulate does not take guess=feedback pairs.\n");
        return EXIT_MALFORMED_INPUT;
    }

    if (p_options->strategy_name_count == 0)
    {
        for (int i = 0; i < TOTAL_DEFINED_STRATEGIES && roster_size < MAX_ROSTER_SIZE; i++)
        {
            roster[roster_size] = ALL_STRATEGIES[i];
            if (p_options->hard_mode) roster[roster_size].hard_mode = true;
            roster_size++;
        }
    }
    else
    {
        for (int i = 0; i < p_options->strategy_name_count; i++)
        {
            if (!resolve_strategy(p_options->strategy_names[i], p_options->hard_mode, &roster[roster_size])) return EXIT_MALFORMED_INPUT;
            roster_size++;
        }
    }

    if (!run_tournament(roster, roster_size, p_dictionary, dictionary_count, p_options->limit, p_options->max_guesses, !p_options->quiet))
    {
        return EXIT_MALFORMED_INPUT;
    }
    return 0;
}

int run_advisor(int argc, const char* const argv[])
{
    command_options_t options;

    if (!parse_command_line(argc, argv, &options))
    {
        print_usage(stderr);
        return EXIT_MALFORMED_INPUT;
    }
    if (options.show_help)
    {
        print_usage(stdout);
        return 0;
    }

    bool is_suggest = options.command != NULL && strcmp(options.command, "suggest") == 0;
    bool is_simulate = options.command != NULL && strcmp(options.command, "simulate") == 0;
    if (!is_suggest && !is_simulate)
    {
        if (options.command == NULL) fprintf(stderr, "No command given.\n");
        else fprintf(stderr, "Unknown command '%s'.\n", options.command);
        print_usage(stderr);
        return EXIT_MALFORMED_INPUT;
    }
    if (options.dictionary_source == NULL)
    {
        fprintf(stderr, "--dict is required.\n");
        return EXIT_MALFORMED_INPUT;
    }

    word_t* p_dictionary = NULL;
    int dictionary_count = 0;
    if (!load_dictionary(options.dictionary_source, options.word_length, &p_dictionary, &dictionary_count, !options.quiet))
    {
        printf("Failed to load dictionary.\n");
        return EXIT_MALFORMED_INPUT;
    }

    int status = is_suggest
        ? run_suggest_command(&options, p_dictionary, dictionary_count)
        : run_simulate_command(&options, p_dictionary, dictionary_count);

    free_dictionary(p_dictionary);
    return status;
}
