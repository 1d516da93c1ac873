#include <gtest/gtest.h>
#include "advisor_commands.h"
#include "knowledge_state.h"
#include "test_helpers.h"
#include <string>
#include <vector>

using test_helpers::make_dictionary;
using test_helpers::TempWordFile;

namespace
{

const std::vector<std::string> kWords = {
    "crane", "slate", "trace", "crate", "react", "caret", "those", "geese", "erase", "speed",
    "eerie", "there", "hello", "level", "abide", "bride", "pride", "prize", "cater", "tears",
    "stare", "shore", "snore", "store", "spore", "score", "swore", "adore", "aside", "irate"
};

// argv as the shell sees it, with the program name in front.
std::vector<const char*> make_argv(const std::vector<const char*>& args)
{
    std::vector<const char*> argv;
    argv.push_back("wordle_advisor");
    argv.insert(argv.end(), args.begin(), args.end());
    return argv;
}

bool parse(const std::vector<const char*>& args, command_options_t* p_options)
{
    std::vector<const char*> argv = make_argv(args);
    return parse_command_line(static_cast<int>(argv.size()), argv.data(), p_options);
}

int run(const std::vector<const char*>& args)
{
    std::vector<const char*> argv = make_argv(args);
    return run_advisor(static_cast<int>(argv.size()), argv.data());
}

int suggest(const std::vector<const char*>& args, const std::vector<word_t>& dictionary, std::string* p_output)
{
    command_options_t options;
    std::vector<const char*> full_args = { "suggest" };
    full_args.insert(full_args.end(), args.begin(), args.end());
    if (!parse(full_args, &options)) return -1;

    testing::internal::CaptureStdout();
    int status = run_suggest_command(&options, dictionary.data(), static_cast<int>(dictionary.size()));
    std::string output = testing::internal::GetCapturedStdout();
    if (p_output != nullptr) *p_output = output;
    return status;
}

} // namespace

TEST(CommandLineTest, Defaults)
{
    command_options_t options;
    ASSERT_TRUE(parse({ "suggest" }, &options));
    EXPECT_STREQ("suggest", options.command);
    EXPECT_EQ(nullptr, options.dictionary_source);
    EXPECT_EQ(DEFAULT_WORD_LENGTH, options.word_length);
    EXPECT_EQ(DEFAULT_SHOW_COUNT, options.show_count);
    EXPECT_EQ(DEFAULT_MAX_GUESSES, options.max_guesses);
    EXPECT_EQ(0, options.limit);
    EXPECT_FALSE(options.hard_mode);
    EXPECT_FALSE(options.quiet);
    EXPECT_EQ(0, options.strategy_name_count);
    EXPECT_EQ(0, options.pair_count);
}

TEST(CommandLineTest, OptionsAndPairs)
{
    command_options_t options;
    ASSERT_TRUE(parse({ "suggest", "--dict", "words.txt", "--length", "6", "--strategy", "Minimax", "--hard",
        "--show", "3", "--quiet", "crane=bbbbb", "slate=gbbbb" }, &options));

    EXPECT_STREQ("words.txt", options.dictionary_source);
    EXPECT_EQ(6, options.word_length);
    EXPECT_EQ(3, options.show_count);
    EXPECT_TRUE(options.hard_mode);
    EXPECT_TRUE(options.quiet);
    ASSERT_EQ(1, options.strategy_name_count);
    EXPECT_STREQ("Minimax", options.strategy_names[0]);
    ASSERT_EQ(2, options.pair_count);
    EXPECT_STREQ("crane=bbbbb", options.pairs[0]);
    EXPECT_STREQ("slate=gbbbb", options.pairs[1]);
}

TEST(CommandLineTest, StrategyIsRepeatable)
{
    command_options_t options;
    ASSERT_TRUE(parse({ "simulate", "--strategy", "Frequency", "--strategy", "Minimax (Crane)",
        "--max-guesses", "8", "--limit", "100" }, &options));
    ASSERT_EQ(2, options.strategy_name_count);
    EXPECT_STREQ("Minimax (Crane)", options.strategy_names[1]);
    EXPECT_EQ(8, options.max_guesses);
    EXPECT_EQ(100, options.limit);
}

TEST(CommandLineTest, RejectsBadOptions)
{
    command_options_t options;
    EXPECT_FALSE(parse({ "suggest", "--bogus", "x" }, &options));
    EXPECT_FALSE(parse({ "suggest", "--dict" }, &options));
    EXPECT_FALSE(parse({ "suggest", "--length", "0" }, &options));
    EXPECT_FALSE(parse({ "suggest", "--length", "17" }, &options));
    EXPECT_FALSE(parse({ "suggest", "--show", "abc" }, &options));
    EXPECT_FALSE(parse({ "simulate", "--max-guesses", "21" }, &options));
    EXPECT_FALSE(parse({ "simulate", "--limit", "0" }, &options));
}

TEST(FeedbackPairTest, AcceptedPairUpdatesTheState)
{
    std::vector<word_t> dictionary = make_dictionary(kWords);
    knowledge_state_t state;
    ASSERT_TRUE(init_knowledge_state(&state, 5));

    char guess[MAX_WORD_LENGTH + 1];
    bool solved = true;
    EXPECT_EQ(0, apply_feedback_pair("CRANE=--g-Y", dictionary.data(), static_cast<int>(dictionary.size()),
        false, &state, guess, &solved));
    EXPECT_STREQ("crane", guess);
    EXPECT_FALSE(solved);
    EXPECT_EQ(1, state.rounds_applied);
    EXPECT_EQ('a', state.green_at[2]);
    EXPECT_TRUE(state.excluded['c' - 'a']);
}

TEST(FeedbackPairTest, MalformedPairsLeaveTheStateAlone)
{
    std::vector<word_t> dictionary = make_dictionary(kWords);
    int count = static_cast<int>(dictionary.size());
    knowledge_state_t state;
    ASSERT_TRUE(init_knowledge_state(&state, 5));

    char guess[MAX_WORD_LENGTH + 1];
    bool solved = false;
    EXPECT_EQ(EXIT_MALFORMED_INPUT, apply_feedback_pair("crane", dictionary.data(), count, false, &state, guess, &solved));
    EXPECT_EQ(EXIT_MALFORMED_INPUT, apply_feedback_pair("=bbbbb", dictionary.data(), count, false, &state, guess, &solved));
    EXPECT_EQ(EXIT_MALFORMED_INPUT, apply_feedback_pair("cranes=bbbbbb", dictionary.data(), count, false, &state, guess, &solved));
    EXPECT_EQ(EXIT_MALFORMED_INPUT, apply_feedback_pair("cr4ne=bbbbb", dictionary.data(), count, false, &state, guess, &solved));
    EXPECT_EQ(EXIT_MALFORMED_INPUT, apply_feedback_pair("crane=bbqbb", dictionary.data(), count, false, &state, guess, &solved));
    EXPECT_EQ(EXIT_MALFORMED_INPUT, apply_feedback_pair("crane=bbbb", dictionary.data(), count, false, &state, guess, &solved));
    EXPECT_EQ(0, state.rounds_applied);
}

TEST(FeedbackPairTest, WordListIsCheckedBeforeTheFeedback)
{
    std::vector<word_t> dictionary = make_dictionary(kWords);
    knowledge_state_t state;
    ASSERT_TRUE(init_knowledge_state(&state, 5));

    char guess[MAX_WORD_LENGTH + 1];
    bool solved = false;
    testing::internal::CaptureStderr();
    int status = apply_feedback_pair("zzzzz=qqqqq", dictionary.data(), static_cast<int>(dictionary.size()),
        true, &state, guess, &solved);
    std::string errors = testing::internal::GetCapturedStderr();

    EXPECT_EQ(EXIT_MALFORMED_INPUT, status);
    EXPECT_NE(std::string::npos, errors.find("not in the word list")) << errors;
    EXPECT_EQ(std::string::npos, errors.find("Invalid character")) << errors;
}

TEST(FeedbackPairTest, HardModeIsCheckedBeforeTheFeedback)
{
    std::vector<word_t> dictionary = make_dictionary(kWords);
    int count = static_cast<int>(dictionary.size());
    knowledge_state_t state;
    ASSERT_TRUE(init_knowledge_state(&state, 5));

    char guess[MAX_WORD_LENGTH + 1];
    bool solved = false;
    ASSERT_EQ(0, apply_feedback_pair("crane=gbbbb", dictionary.data(), count, true, &state, guess, &solved));

    // "slate" drops the green 'c'; the broken feedback is never looked at
    EXPECT_EQ(EXIT_HARD_MODE_VIOLATION, apply_feedback_pair("slate=qqqqq", dictionary.data(), count, true, &state, guess, &solved));
    EXPECT_EQ(EXIT_MALFORMED_INPUT, apply_feedback_pair("slate=qqqqq", dictionary.data(), count, false, &state, guess, &solved));
    EXPECT_EQ(1, state.rounds_applied);
}

TEST(FeedbackPairTest, AllGreenReportsSolved)
{
    std::vector<word_t> dictionary = make_dictionary(kWords);
    knowledge_state_t state;
    ASSERT_TRUE(init_knowledge_state(&state, 5));

    char guess[MAX_WORD_LENGTH + 1];
    bool solved = false;
    EXPECT_EQ(0, apply_feedback_pair("Slate=GGGGG", dictionary.data(), static_cast<int>(dictionary.size()),
        false, &state, guess, &solved));
    EXPECT_TRUE(solved);
    EXPECT_STREQ("slate", guess);
}

TEST(SuggestCommandTest, NoHistoryRecommendsAGuess)
{
    std::vector<word_t> dictionary = make_dictionary(kWords);
    std::string output;
    EXPECT_EQ(0, suggest({}, dictionary, &output));
    EXPECT_NE(std::string::npos, output.find("Remaining valid words: 30")) << output;
    EXPECT_NE(std::string::npos, output.find("... and 20 more")) << output;
    EXPECT_NE(std::string::npos, output.find(">>> RECOMMENDED GUESS: ")) << output;
}

TEST(SuggestCommandTest, SingleSurvivorIsTheAnswer)
{
    std::vector<word_t> dictionary = make_dictionary(kWords);
    std::string output;
    EXPECT_EQ(0, suggest({ "crane=gggbg" }, dictionary, &output));
    EXPECT_NE(std::string::npos, output.find("Remaining valid words: 1")) << output;
    EXPECT_NE(std::string::npos, output.find(">>> THE ANSWER IS: crate <<<")) << output;
}

TEST(SuggestCommandTest, NoSurvivorsExitWithTwo)
{
    std::vector<word_t> dictionary = make_dictionary(kWords);
    std::string output;
    EXPECT_EQ(EXIT_NO_CANDIDATES, suggest({ "crane=ggggb" }, dictionary, &output));
    EXPECT_NE(std::string::npos, output.find("Remaining valid words: 0")) << output;
    EXPECT_NE(std::string::npos, output.find("CRITICAL: No words remaining!")) << output;
}

TEST(SuggestCommandTest, HardModeViolationExitsWithThree)
{
    std::vector<word_t> dictionary = make_dictionary(kWords);
    EXPECT_EQ(EXIT_HARD_MODE_VIOLATION, suggest({ "--hard", "crane=gbbbb", "slate=bbbbb" }, dictionary, nullptr));

    // A hard-mode strategy enforces the rule without --hard
    EXPECT_EQ(EXIT_HARD_MODE_VIOLATION, suggest({ "--strategy", "Minimax (Hard)", "crane=gbbbb", "slate=bbbbb" }, dictionary, nullptr));

    // Outside hard mode the same history is fine
    EXPECT_NE(EXIT_HARD_MODE_VIOLATION, suggest({ "crane=gbbbb", "slate=bbbbb" }, dictionary, nullptr));
}

TEST(SuggestCommandTest, SolvedPairStopsTheReplay)
{
    std::vector<word_t> dictionary = make_dictionary(kWords);
    std::string output;
    EXPECT_EQ(0, suggest({ "crane=bbbbb", "slate=ggggg", "not-a-pair" }, dictionary, &output));
    EXPECT_NE(std::string::npos, output.find("*** SOLVED: 'slate' in 2 guesses! ***")) << output;
    EXPECT_EQ(std::string::npos, output.find("Remaining valid words")) << output;
}

TEST(SuggestCommandTest, MalformedInputExitsWithOne)
{
    std::vector<word_t> dictionary = make_dictionary(kWords);
    EXPECT_EQ(EXIT_MALFORMED_INPUT, suggest({ "zzzzz=bbbbb" }, dictionary, nullptr));
    EXPECT_EQ(EXIT_MALFORMED_INPUT, suggest({ "crane=bbxqb" }, dictionary, nullptr));
    EXPECT_EQ(EXIT_MALFORMED_INPUT, suggest({ "--strategy", "Entropy" }, dictionary, nullptr));
    EXPECT_EQ(EXIT_MALFORMED_INPUT, suggest({ "--strategy", "Frequency", "--strategy", "Minimax" }, dictionary, nullptr));
}

TEST(SimulateCommandTest, RejectsPairsAndUnknownStrategies)
{
    std::vector<word_t> dictionary = make_dictionary(kWords);
    int count = static_cast<int>(dictionary.size());
    command_options_t options;

    ASSERT_TRUE(parse({ "simulate", "crane=bbbbb" }, &options));
    EXPECT_EQ(EXIT_MALFORMED_INPUT, run_simulate_command(&options, dictionary.data(), count));

    ASSERT_TRUE(parse({ "simulate", "--strategy", "Entropy" }, &options));
    EXPECT_EQ(EXIT_MALFORMED_INPUT, run_simulate_command(&options, dictionary.data(), count));
}

TEST(SimulateCommandTest, RunsTheNamedStrategies)
{
    std::vector<word_t> dictionary = make_dictionary({ "crane", "slate", "store", "shore", "trace", "those" });
    command_options_t options;
    ASSERT_TRUE(parse({ "simulate", "--quiet", "--strategy", "frequency", "--strategy", "Minimax (Crane)" }, &options));

    testing::internal::CaptureStdout();
    int status = run_simulate_command(&options, dictionary.data(), static_cast<int>(dictionary.size()));
    std::string output = testing::internal::GetCapturedStdout();
    EXPECT_EQ(0, status);
    EXPECT_NE(std::string::npos, output.find("TOURNAMENT CHAMPION")) << output;
}

TEST(AdvisorTest, ExitStatusOfTheWholeProgram)
{
    TempWordFile file("crane\nslate\ncrate\nstore\ntrace\n");
    ASSERT_FALSE(file.path().empty());
    const char* path = file.path().c_str();

    testing::internal::CaptureStdout();
    testing::internal::CaptureStderr();
    int help = run({ "--help" });
    int no_command = run({});
    int unknown_command = run({ "play", "--dict", path });
    int unknown_option = run({ "suggest", "--dict", path, "--colour", "on" });
    int missing_dict = run({ "suggest" });
    int missing_file = run({ "suggest", "--quiet", "--dict", "/nonexistent/wordle_advisor/words.txt" });
    int answer = run({ "suggest", "--quiet", "--dict", path, "crane=gggbg" });
    int empty = run({ "suggest", "--quiet", "--dict", path, "crane=ggggb" });
    int hard = run({ "suggest", "--quiet", "--hard", "--dict", path, "crane=gbbbb", "slate=bbbbb" });
    int simulate = run({ "simulate", "--quiet", "--dict", path, "--strategy", "Frequency" });
    std::string errors = testing::internal::GetCapturedStderr();
    std::string output = testing::internal::GetCapturedStdout();

    EXPECT_EQ(0, help);
    EXPECT_EQ(EXIT_MALFORMED_INPUT, no_command);
    EXPECT_EQ(EXIT_MALFORMED_INPUT, unknown_command);
    EXPECT_EQ(EXIT_MALFORMED_INPUT, unknown_option);
    EXPECT_EQ(EXIT_MALFORMED_INPUT, missing_dict);
    EXPECT_EQ(EXIT_MALFORMED_INPUT, missing_file);
    EXPECT_EQ(0, answer);
    EXPECT_EQ(EXIT_NO_CANDIDATES, empty);
    EXPECT_EQ(EXIT_HARD_MODE_VIOLATION, hard);
    EXPECT_EQ(0, simulate);

    EXPECT_NE(std::string::npos, output.find(">>> THE ANSWER IS: crate <<<")) << output;
    EXPECT_NE(std::string::npos, errors.find("Unknown option '--colour'")) << errors;
}
