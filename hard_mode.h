/*
 * FILE: hard_mode.h
 *
 * WHAT:
 * Defines the Hard Mode rule check.
 *
 * WHY:
 * In Hard Mode every guess must reuse the information already revealed:
 * Green letters stay where they are and every Yellow/Green letter appears
 * somewhere in the guess. The Guess Selector uses this to restrict its guess
 * pool, and the Suggest command uses it to reject a user's illegal guess.
 */

#pragma once
#ifndef HARD_MODE_H
#define HARD_MODE_H
#include "solver_types.h"

/*
 * FUNCTION: is_valid_hard_mode_guess
 *
 * WHAT:
 * False if `guess` moves away from a known Green position or leaves out a
 * letter that is confirmed present. Exact counts and Yellow positions are
 * NOT enforced: a guess may repeat a letter more often than the secret holds,
 * or retry a Yellow letter in the same spot.
 */
bool is_valid_hard_mode_guess(const char* guess, const knowledge_state_t* p_state);

#endif
