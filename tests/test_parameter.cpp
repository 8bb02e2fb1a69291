/**
 * @file test_parameter.cpp
 * @brief Unit tests for command parameter selection (GoogleTest)
 */

#include <gtest/gtest.h>
#include "pathexpr/Parameter.hpp"
#include "pathexpr/Properties.hpp"
#include "TestModels.hpp"

using namespace pathexpr;
using namespace pathexpr::fixtures;

namespace {

// Event argument object: OriginalSource → RootModel
class SampleEventArgs : public Reflected<SampleEventArgs> {
public:
    std::shared_ptr<RootModel> original_source;

    static const PropertyTable<SampleEventArgs>& properties() {
        static const PropertyTable<SampleEventArgs> table = PropertyTable<SampleEventArgs>()
            .add("OriginalSource", [](const SampleEventArgs& e) { return Value(e.original_source); });
        return table;
    }
};

// Converter recording what it was called with
class RecordingConverter : public ValueConverter {
public:
    mutable Value last_value;
    mutable Value last_parameter;

    Value convert(const Value& value, const Value& parameter) const override {
        last_value = value;
        last_parameter = parameter;
        return Value("converted");
    }

    Value convert_back(const Value&, const Value&) const override {
        return Value();
    }
};

} // namespace

class ParameterTest : public ::testing::Test {
protected:
    std::shared_ptr<RootModel> sender_model = make_test_model();
    std::shared_ptr<SampleEventArgs> args_model = std::make_shared<SampleEventArgs>();
    Value sender{sender_model};
    Value args;

    void SetUp() override {
        args_model->original_source = make_test_model();
        args_model->original_source->title = "Event Source";
        args = Value(args_model);
    }
};

TEST_F(ParameterTest, NothingConfiguredYieldsNull) {
    ParameterOptions options;
    EXPECT_TRUE(resolve_command_parameter(sender, args, options).is_null());
}

TEST_F(ParameterTest, ExplicitParameterWins) {
    RecordingConverter converter;
    ParameterOptions options;
    options.command_parameter = Value("explicit");
    options.event_args_path = "OriginalSource.Title";
    options.sender_path = "Title";
    options.converter = &converter;
    options.pass_event_args = true;

    EXPECT_EQ(resolve_command_parameter(sender, args, options), Value("explicit"));
    EXPECT_TRUE(converter.last_value.is_null());
}

TEST_F(ParameterTest, EventArgsPath) {
    ParameterOptions options;
    options.event_args_path = "OriginalSource.Title";
    options.sender_path = "Title";
    EXPECT_EQ(resolve_command_parameter(sender, args, options), Value("Event Source"));
}

TEST_F(ParameterTest, SenderPath) {
    ParameterOptions options;
    options.sender_path = "ItemArray[0].Title";
    EXPECT_EQ(resolve_command_parameter(sender, args, options), Value("Array Item 1"));
}

TEST_F(ParameterTest, ConfiguredPathThatMissesStillWins) {
    ParameterOptions options;
    options.event_args_path = "OriginalSource.Missing";
    options.pass_event_args = true;
    EXPECT_TRUE(resolve_command_parameter(sender, args, options).is_null());
}

TEST_F(ParameterTest, ConverterReceivesArgsAndSender) {
    RecordingConverter converter;
    ParameterOptions options;
    options.converter = &converter;
    options.pass_event_args = true;

    EXPECT_EQ(resolve_command_parameter(sender, args, options), Value("converted"));
    EXPECT_EQ(converter.last_value, args);
    EXPECT_EQ(converter.last_parameter, sender);
}

TEST_F(ParameterTest, PathConverterWithSenderParameter) {
    // A path converter given a non-string sender resolves nothing
    PathExpressionConverter converter;
    ParameterOptions options;
    options.converter = &converter;
    EXPECT_TRUE(resolve_command_parameter(sender, args, options).is_null());

    EXPECT_EQ(resolve_command_parameter(Value("OriginalSource.Title"), args, options),
              Value("Event Source"));
}

TEST_F(ParameterTest, PassEventArgs) {
    ParameterOptions options;
    options.pass_event_args = true;
    EXPECT_EQ(resolve_command_parameter(sender, args, options), args);
}
