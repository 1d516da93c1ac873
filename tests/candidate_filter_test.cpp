#include <gtest/gtest.h>
#include "candidate_filter.h"
#include "knowledge_state.h"
#include "pattern_encoder.h"
#include "test_helpers.h"
#include <algorithm>
#include <string>
#include <vector>

using test_helpers::make_dictionary;
using test_helpers::make_pattern;
using test_helpers::make_view;
using test_helpers::play_round;

namespace
{

const std::vector<std::string> kWords = {
    "crane", "slate", "trace", "crate", "react", "caret", "those", "geese", "erase", "speed",
    "eerie", "there", "hello", "level", "abide", "bride", "pride", "prize", "cater", "tears"
};

std::vector<std::string> filter_words(const knowledge_state_t& state, const std::vector<word_t>& dictionary)
{
    std::vector<const word_t*> out(dictionary.size());
    int count = filter_dictionary(&state, dictionary.data(), static_cast<int>(dictionary.size()), out.data());
    std::vector<std::string> words;
    for (int i = 0; i < count; i++) words.push_back(out[i]->letters);
    return words;
}

} // namespace

TEST(CandidateFilterTest, FreshStateKeepsEveryWord)
{
    std::vector<word_t> dictionary = make_dictionary(kWords);
    knowledge_state_t state;
    ASSERT_TRUE(init_knowledge_state(&state, 5));
    EXPECT_EQ(dictionary.size(), filter_words(state, dictionary).size());
}

TEST(CandidateFilterTest, CraneAgainstSlate)
{
    std::vector<word_t> dictionary = make_dictionary(kWords);
    knowledge_state_t state;
    ASSERT_TRUE(init_knowledge_state(&state, 5));
    ASSERT_TRUE(play_round(&state, "crane", "slate"));

    std::vector<std::string> survivors = filter_words(state, dictionary);
    ASSERT_EQ(1u, survivors.size());
    EXPECT_EQ("slate", survivors[0]);
}

TEST(CandidateFilterTest, SecretAlwaysSurvives)
{
    std::vector<word_t> dictionary = make_dictionary(kWords);
    for (const std::string& guess : kWords)
    {
        for (const std::string& secret : kWords)
        {
            knowledge_state_t state;
            ASSERT_TRUE(init_knowledge_state(&state, 5));
            ASSERT_TRUE(play_round(&state, guess.c_str(), secret.c_str()));
            EXPECT_TRUE(is_candidate_consistent(&state, secret.c_str())) << guess << " vs " << secret;

            // A wrong guess always rules itself out
            if (guess != secret)
            {
                EXPECT_FALSE(is_candidate_consistent(&state, guess.c_str())) << guess << " vs " << secret;
            }
        }
    }
}

TEST(CandidateFilterTest, FilteringIsIdempotent)
{
    std::vector<word_t> dictionary = make_dictionary(kWords);
    knowledge_state_t state;
    ASSERT_TRUE(init_knowledge_state(&state, 5));
    ASSERT_TRUE(play_round(&state, "tears", "crate"));

    std::vector<const word_t*> once(dictionary.size());
    int once_count = filter_dictionary(&state, dictionary.data(), static_cast<int>(dictionary.size()), once.data());
    ASSERT_GT(once_count, 0);

    std::vector<const word_t*> twice(dictionary.size());
    int twice_count = filter_candidates(&state, once.data(), once_count, twice.data());
    ASSERT_EQ(once_count, twice_count);
    for (int i = 0; i < once_count; i++) EXPECT_EQ(once[i], twice[i]);
}

TEST(CandidateFilterTest, FilterCandidatesWorksInPlace)
{
    std::vector<word_t> dictionary = make_dictionary(kWords);
    std::vector<const word_t*> view = make_view(dictionary);

    knowledge_state_t state;
    ASSERT_TRUE(init_knowledge_state(&state, 5));
    ASSERT_TRUE(play_round(&state, "pride", "bride"));

    int count = filter_candidates(&state, view.data(), static_cast<int>(view.size()), view.data());
    ASSERT_EQ(1, count);
    EXPECT_STREQ("bride", view[0]->letters);
}

TEST(CandidateFilterTest, CandidateSetNeverGrows)
{
    std::vector<word_t> dictionary = make_dictionary(kWords);
    const char* secret = "caret";
    const char* guesses[] = { "speed", "tears", "trace", "crate" };

    knowledge_state_t state;
    ASSERT_TRUE(init_knowledge_state(&state, 5));
    std::vector<std::string> previous = filter_words(state, dictionary);

    for (const char* guess : guesses)
    {
        ASSERT_TRUE(play_round(&state, guess, secret));
        std::vector<std::string> current = filter_words(state, dictionary);

        EXPECT_LE(current.size(), previous.size());
        for (const std::string& word : current)
        {
            EXPECT_NE(previous.end(), std::find(previous.begin(), previous.end(), word)) << word;
        }
        EXPECT_NE(current.end(), std::find(current.begin(), current.end(), std::string(secret)));
        previous = current;
    }

    // "cater" is still consistent with every clue
    EXPECT_EQ(2u, previous.size());
}

TEST(CandidateFilterTest, ContradictoryStateRejectsEverything)
{
    std::vector<word_t> dictionary = make_dictionary(kWords);
    knowledge_state_t state;
    ASSERT_TRUE(init_knowledge_state(&state, 5));

    feedback_pattern_t green_c = make_pattern("EAAAA");
    ASSERT_TRUE(update_knowledge_state(&state, "crane", &green_c));
    feedback_pattern_t green_s = make_pattern("EAAAA");
    ASSERT_TRUE(update_knowledge_state(&state, "slate", &green_s));
    ASSERT_TRUE(state.is_contradictory);

    EXPECT_TRUE(filter_words(state, dictionary).empty());
}

TEST(CandidateFilterTest, WrongLengthWordsAreRejected)
{
    knowledge_state_t state;
    ASSERT_TRUE(init_knowledge_state(&state, 5));
    EXPECT_TRUE(is_candidate_consistent(&state, "crane"));
    EXPECT_FALSE(is_candidate_consistent(&state, "cranes"));
    EXPECT_FALSE(is_candidate_consistent(&state, "cran"));
}
