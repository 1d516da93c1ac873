/*
 * FILE: word_source.h
 *
 * WHAT:
 * Defines the interface for the Dictionary Loading subsystem.
 * This module turns a word list (a local file or an http/https URL) into the
 * sorted, duplicate-free, length-L word array the engine works on.
 *
 * WHY:
 * The engine assumes clean input: lower-case letters only, one length,
 * no duplicates. Doing all of that normalisation in one place, before the
 * first round, lets every other module skip re-validating words.
 */

#pragma once
#ifndef WORD_SOURCE_H
#define WORD_SOURCE_H
#include "solver_types.h"

/*
 * FUNCTION: load_dictionary
 *
 * WHAT:
 * 1. Reads the whole source: a file path, or downloads it with libcurl when
 *    `source` starts with "http://" or "https://".
 * 2. Normalises it with `parse_word_list_text`.
 *
 * PARAMETERS:
 * - source: Path or URL of a text file with one word per line.
 * - word_length: The session length L.
 * - pp_dictionary: Output. Receives a malloc'd array (free with free_dictionary).
 * - p_dictionary_count: Output. Number of words in the array.
 * - verbose: Print a one-line load summary on stdout.
 *
 * RETURNS:
 * - true if at least one word of length L was loaded.
 * - false on I/O, download or allocation failure, or an empty result.
 */
bool load_dictionary(const char* source, int word_length, word_t** pp_dictionary, int* p_dictionary_count, bool verbose);

/*
 * FUNCTION: parse_word_list_text
 *
 * WHAT:
 * Splits `text` into lines, trims surrounding whitespace, lower-cases,
 * rejects lines containing anything but letters, keeps only words of
 * `word_length` letters, then sorts and removes duplicates.
 *
 * RETURNS:
 * - true on success (the result may be empty: *p_word_count == 0).
 * - false on allocation failure.
 */
bool parse_word_list_text(const char* text, int word_length, word_t** pp_words, int* p_word_count);

/*
 * FUNCTION: find_dictionary_word
 *
 * Binary search in a dictionary produced by this module (sorted).
 * Returns NULL if `word` is not present.
 */
const word_t* find_dictionary_word(const word_t* p_dictionary, int dictionary_count, const char* word);

/*
 * FUNCTION: free_dictionary
 */
void free_dictionary(word_t* p_dictionary);

#endif
