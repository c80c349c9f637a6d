#include <gtest/gtest.h>
#include <runstream/run_shape.hpp>
#include "../../testing/test_helpers.hpp"

using runstream::ChainRun;
using runstream::LegacyRun;
using runstream::Value;
using runstream::ValueList;
using runstream::ValueObject;

namespace {

const std::vector<std::string> kLegacyTypes{"retriever", "tool", "llm"};

} // anonymous namespace

TEST(RunShapeTest, Classification) {
    auto tool = runstream::classify_run("tool", kLegacyTypes);
    EXPECT_TRUE(runstream::is_legacy(tool));
    EXPECT_EQ(runstream::run_category(tool), "tool");

    auto chain = runstream::classify_run("chain", kLegacyTypes);
    EXPECT_FALSE(runstream::is_legacy(chain));
    EXPECT_TRUE(std::holds_alternative<ChainRun>(chain));
    EXPECT_EQ(runstream::run_category(chain), "chain");

    // Unknown and missing types follow the chain convention
    EXPECT_FALSE(runstream::is_legacy(runstream::classify_run("prompt", kLegacyTypes)));
    EXPECT_EQ(runstream::run_category(runstream::classify_run("", kLegacyTypes)), "");

    // The legacy set is configurable
    EXPECT_FALSE(runstream::is_legacy(runstream::classify_run("llm", {"tool"})));
}

TEST(RunShapeTest, ConsumeFieldIsOneShot) {
    ValueObject state{{"final_output", "x"}};

    auto first = runstream::consume_field(state, "final_output");
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(*first, Value("x"));

    EXPECT_FALSE(runstream::consume_field(state, "final_output").has_value());
    EXPECT_FALSE(state.contains("final_output"));
}

TEST(RunShapeTest, LegacyStartCarriesRawInputs) {
    LegacyRun run{"retriever"};
    ValueObject state{{"inputs", ValueObject{{"query", "weather"}}}};

    ValueObject data = runstream::start_event_data(run, state);
    EXPECT_EQ(data.at("input"), Value(ValueObject{{"query", "weather"}}));

    // Start leaves inputs in place
    EXPECT_TRUE(state.contains("inputs"));
}

TEST(RunShapeTest, LegacyStartSkipsEmptyInputs) {
    LegacyRun run{"tool"};
    ValueObject empty_inputs{{"inputs", ValueObject{}}};
    EXPECT_TRUE(runstream::start_event_data(run, empty_inputs).empty());

    ValueObject no_inputs;
    EXPECT_TRUE(runstream::start_event_data(run, no_inputs).empty());
}

TEST(RunShapeTest, ChainStartUnwrapsInput) {
    ChainRun run{"chain"};
    ValueObject state{{"inputs", ValueObject{{"input", "hello"}}}};
    EXPECT_EQ(runstream::start_event_data(run, state).at("input"), Value("hello"));

    // Input not known yet
    ValueObject pending{{"inputs", ValueObject{}}};
    EXPECT_FALSE(runstream::start_event_data(run, pending).contains("input"));
}

TEST(RunShapeTest, LegacyEndConsumesOutputAndInputs) {
    LegacyRun run{"llm"};
    ValueObject state{
        {"final_output", ValueObject{{"generations", ValueList{"hi"}}}},
        {"inputs", ValueObject{{"prompts", ValueList{"say hi"}}}}
    };

    ValueObject data = runstream::end_event_data(run, state);

    EXPECT_EQ(data.at("output"), Value(ValueObject{{"generations", ValueList{"hi"}}}));
    EXPECT_EQ(data.at("input"), Value(ValueObject{{"prompts", ValueList{"say hi"}}}));
    EXPECT_FALSE(state.contains("final_output"));
    EXPECT_FALSE(state.contains("inputs"));
}

TEST(RunShapeTest, LegacyEndWithoutOutput) {
    LegacyRun run{"tool"};
    ValueObject state{{"inputs", ValueObject{}}};

    ValueObject data = runstream::end_event_data(run, state);

    EXPECT_TRUE(data.at("output").is_null());
    EXPECT_FALSE(data.contains("input"));
    EXPECT_TRUE(state.contains("inputs"));
}

TEST(RunShapeTest, ChainEndUnwrapsOutput) {
    ChainRun run{"chain"};
    ValueObject state{
        {"final_output", ValueObject{{"output", "done"}}},
        {"inputs", ValueObject{{"input", "question"}}}
    };

    ValueObject data = runstream::end_event_data(run, state);

    EXPECT_EQ(data.at("output"), Value("done"));
    EXPECT_EQ(data.at("input"), Value("question"));
    EXPECT_FALSE(state.contains("final_output"));
    EXPECT_FALSE(state.contains("inputs"));
}

TEST(RunShapeTest, ChainEndNullOutput) {
    ChainRun run{"chain"};

    ValueObject absent;
    EXPECT_TRUE(runstream::end_event_data(run, absent).at("output").is_null());

    ValueObject null_output{{"final_output", nullptr}};
    EXPECT_TRUE(runstream::end_event_data(run, null_output).at("output").is_null());

    ValueObject unwrapped{{"final_output", ValueObject{{"text", "x"}}}};
    EXPECT_TRUE(runstream::end_event_data(run, unwrapped).at("output").is_null());
}

TEST(RunShapeTest, ChainEndIgnoresOtherOutputShapes) {
    ChainRun run{"chain"};
    ValueObject state{{"final_output", "plain string"}};

    ValueObject data = runstream::end_event_data(run, state);

    EXPECT_FALSE(data.contains("output"));
    EXPECT_TRUE(state.contains("final_output"));
}

TEST(RunShapeTest, ChainEndLeavesUnwrappedInputs) {
    ChainRun run{"chain"};
    ValueObject state{{"inputs", ValueObject{{"question", "q"}}}};

    ValueObject data = runstream::end_event_data(run, state);

    EXPECT_FALSE(data.contains("input"));
    EXPECT_TRUE(state.contains("inputs"));
}

TEST(RunShapeTest, RootOutput) {
    EXPECT_EQ(runstream::root_output(ChainRun{"chain"}, Value(ValueObject{{"output", "done"}})), Value("done"));
    EXPECT_EQ(runstream::root_output(ChainRun{"chain"}, Value("raw")), Value("raw"));
    EXPECT_TRUE(runstream::root_output(ChainRun{"chain"}, Value()).is_null());

    Value wrapped(ValueObject{{"output", "done"}});
    EXPECT_EQ(runstream::root_output(LegacyRun{"llm"}, wrapped), wrapped);
}
