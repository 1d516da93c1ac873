/*
 * PROJECT: Wordle Advisor (Constraint Tracker & Guess Selector)
 *
 * ARCHITECTURE OVERVIEW:
 * The application is a small command-line shell around a reusable engine.
 * The layers are:
 *
 * 1. Data Layer: Loads the word list from a file or URL, normalises it and
 * keeps it sorted for binary search (word_source).
 * 2. Logic Layer: Feedback encoding (pattern_encoder), accumulated knowledge
 * (knowledge_state), candidate filtering (candidate_filter) and the hard
 * mode rules (hard_mode).
 * 3. Strategy Layer: Strategies are data objects ("StrategyConfig") that
 * name an algorithm (Frequency or Minimax) plus flags such as hard mode or a
 * fixed opener. The selector dispatches on them (guess_selector).
 * 4. Shell: Option parsing and the commands (advisor_commands). This file
 *    only hands argv over.
 *
 * COMMANDS:
 * - suggest : Replays "guess=feedback" pairs, then prints the remaining
 *   candidates, the accumulated knowledge and the recommended next guess.
 *   Example: wordle_advisor suggest --dict words.txt crane=bbgbg
 * - simulate: The strategy tournament. Every selected strategy plays every
 *   dictionary word as the secret.
 *   Example: wordle_advisor simulate --dict words.txt --strategy Minimax
 *
 * EXIT STATUS:
 * - 0: Success.
 * - 1: Malformed input or a resource failure (file, download, memory).
 * - 2: The feedback left no candidate words.
 * - 3: A guess broke the hard mode rules.
 */

#include "advisor_commands.h"

int main(int argc, char* argv[])
{
    return run_advisor(argc, argv);
}
