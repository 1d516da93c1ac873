/*
 * FILE: advisor_commands.h
 *
 * WHAT:
 * Defines the command-line shell: option parsing, the "guess=feedback"
 * replay and the `suggest` / `simulate` commands.
 *
 * WHY:
 * The shell decides exit codes and the order in which user input is
 * validated. Keeping it out of main.cpp lets the unit tests drive it with a
 * made-up argv and an in-memory dictionary.
 *
 * EXIT STATUS:
 * - 0: Success.
 * - 1: Malformed input or a resource failure (file, download, memory).
 * - 2: The feedback left no candidate words.
 * - 3: A guess broke the hard mode rules.
 */

#pragma once
#ifndef ADVISOR_COMMANDS_H
#define ADVISOR_COMMANDS_H
#include "solver_types.h"
#include "knowledge_state.h"
#include <stdio.h>

// CONSTANTS: Exit codes and option defaults
const int EXIT_MALFORMED_INPUT = 1;
const int EXIT_NO_CANDIDATES = 2;
const int EXIT_HARD_MODE_VIOLATION = 3;

const int DEFAULT_WORD_LENGTH = 5;
const int DEFAULT_SHOW_COUNT = 10;
const int DEFAULT_MAX_GUESSES = 6;
const char* const DEFAULT_STRATEGY_NAME = "Frequency";
const int MAX_ROSTER_SIZE = 32;
const int MAX_FEEDBACK_PAIRS = 64;

/*
 * STRUCT: command_options_t
 *
 * Everything the command line can set. Filled by `parse_command_line`.
 * The strings point into argv.
 */
typedef struct _command_options
{
    const char* command;
    const char* dictionary_source;
    int word_length;
    bool hard_mode;
    bool quiet;
    bool show_help;
    int show_count;
    int max_guesses;
    int limit;
    const char* strategy_names[MAX_ROSTER_SIZE];
    int strategy_name_count;
    const char* pairs[MAX_FEEDBACK_PAIRS];
    int pair_count;
} command_options_t;

void print_usage(FILE* fpOut);

/*
 * FUNCTION: parse_command_line
 *
 * WHAT:
 * Walks argv once. The first non-option argument is the command; later
 * non-option arguments are "guess=feedback" pairs.
 *
 * RETURNS:
 * - false on an unknown option, a missing value or a bad number.
 */
bool parse_command_line(int argc, const char* const argv[], command_options_t* p_options);

/*
 * FUNCTION: apply_feedback_pair
 *
 * WHAT:
 * Validates one "guess=feedback" argument and folds it into the state.
 * The checks run in order: syntax, length, dictionary membership, hard mode,
 * feedback tokens. The state is only touched once all of them pass.
 *
 * RETURNS:
 * - 0 on success, otherwise the exit code to terminate with.
 * - `guess` receives the normalised word (capacity >= MAX_WORD_LENGTH + 1).
 * - `*p_solved` is set if the feedback was all green.
 */
int apply_feedback_pair(const char* pair,
    const word_t* p_dictionary,
    int dictionary_count,
    bool hard_mode,
    knowledge_state_t* p_state,
    char* guess,
    bool* p_solved);

/*
 * FUNCTION: run_suggest_command
 *
 * WHAT:
 * The one-shot advisor:
 * 1. Replays every feedback pair into a fresh knowledge state. An all-green
 *    pair reports the solve and stops.
 * 2. Filters the dictionary.
 * 3. Prints the survivors, the knowledge summary and the recommendation.
 */
int run_suggest_command(const command_options_t* p_options, const word_t* p_dictionary, int dictionary_count);

/*
 * FUNCTION: run_simulate_command
 *
 * Builds the tournament roster (every named strategy, or all defined
 * strategies when none was named) and runs it.
 */
int run_simulate_command(const command_options_t* p_options, const word_t* p_dictionary, int dictionary_count);

/*
 * FUNCTION: run_advisor
 *
 * WHAT:
 * The whole program behind `main`.
 * 1. Parses the command line.
 * 2. Loads the dictionary (file or URL).
 * 3. Dispatches to the command.
 * 4. Frees the dictionary.
 *
 * RETURNS:
 * - The process exit status.
 */
int run_advisor(int argc, const char* const argv[]);

#endif
