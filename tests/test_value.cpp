/**
 * @file test_value.cpp
 * @brief Tests for Value, PropertyTable and sequence adapters
 */

#include <gtest/gtest.h>
#include "pathexpr/Properties.hpp"
#include "pathexpr/Value.hpp"
#include "TestModels.hpp"

#include <sstream>

using namespace pathexpr;
using namespace pathexpr::fixtures;

// ============================================================================
// Value
// ============================================================================

TEST(Value, DefaultIsNull) {
    Value v;
    EXPECT_TRUE(v.is_null());
    EXPECT_EQ(type_name(v), "null");
}

TEST(Value, NullPointersNormalizeToNull) {
    const char* no_string = nullptr;
    std::shared_ptr<RootModel> no_object;
    std::shared_ptr<ValueArray> no_sequence;

    EXPECT_TRUE(Value(no_string).is_null());
    EXPECT_TRUE(Value(no_object).is_null());
    EXPECT_TRUE(Value(no_sequence).is_null());
    EXPECT_TRUE(Value(nullptr).is_null());
}

TEST(Value, ScalarTypeQueries) {
    EXPECT_TRUE(Value(true).is_boolean());
    EXPECT_TRUE(Value(3).is_integer());
    EXPECT_TRUE(Value(2.5).is_float());
    EXPECT_TRUE(Value(2.5).is_number());
    EXPECT_TRUE(Value("text").is_string());
    EXPECT_TRUE(Value(std::string("text")).is_string());

    EXPECT_EQ(type_name(Value(true)), "boolean");
    EXPECT_EQ(type_name(Value(3)), "integer");
    EXPECT_EQ(type_name(Value(2.5)), "float");
    EXPECT_EQ(type_name(Value("text")), "string");
}

TEST(Value, StringIsNotASequence) {
    Value v("abc");
    EXPECT_FALSE(v.is_sequence());
    EXPECT_EQ(v.as_sequence(), nullptr);
    EXPECT_EQ(v.as_object(), nullptr);
}

TEST(Value, GetIf) {
    Value v(42);
    ASSERT_NE(v.get_if<std::int64_t>(), nullptr);
    EXPECT_EQ(*v.get_if<std::int64_t>(), 42);
    EXPECT_EQ(v.get_if<std::string>(), nullptr);
}

TEST(Value, ScalarsCompareByValue) {
    EXPECT_EQ(Value("a"), Value(std::string("a")));
    EXPECT_EQ(Value(1), Value(std::int64_t{1}));
    EXPECT_NE(Value(1), Value(1.0));
    EXPECT_NE(Value("1"), Value(1));
    EXPECT_EQ(Value(), Value(nullptr));
}

TEST(Value, ObjectsCompareByIdentity) {
    auto a = ItemModel::make(1, "x");
    auto b = ItemModel::make(1, "x");
    EXPECT_EQ(Value(a), Value(a));
    EXPECT_NE(Value(a), Value(b));
}

TEST(Value, ObjectTypeName) {
    EXPECT_EQ(type_name(Value(make_test_model())), "RootModel");
    EXPECT_EQ(type_name(make_array(std::vector<int>{1})), "sequence");
}

TEST(Value, StreamRendering) {
    std::ostringstream oss;
    oss << Value() << ' ' << Value(true) << ' ' << Value(7) << ' ' << Value("s") << ' '
        << Value(ItemModel::make(1, "x")) << ' ' << make_array(std::vector<int>{1, 2});
    EXPECT_EQ(oss.str(), "null true 7 \"s\" <ItemModel> <sequence[2]>");
}

// ============================================================================
// PropertyTable / Reflected
// ============================================================================

TEST(PropertyTable, RegisteredNamesOnly) {
    const auto& table = RootModel::properties();
    EXPECT_TRUE(table.contains("Title"));
    EXPECT_TRUE(table.contains("ChildrenList"));
    EXPECT_FALSE(table.contains("Secret"));
    EXPECT_FALSE(table.contains("PublicField"));

    std::vector<std::string> expected = {"Child", "ChildrenList", "Id", "ItemArray", "Title"};
    EXPECT_EQ(table.names(), expected);
}

TEST(PropertyTable, GetReadsCurrentState) {
    auto item = ItemModel::make(5, "before");
    auto value = item->get_member("Title");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, Value("before"));

    item->title = "after";
    EXPECT_EQ(*item->get_member("Title"), Value("after"));
}

TEST(PropertyTable, UnknownNameIsNullopt) {
    auto item = ItemModel::make(5, "x");
    EXPECT_FALSE(item->get_member("Missing").has_value());
    EXPECT_FALSE(item->get_member("").has_value());
}

TEST(PropertyTable, AddReplacesExistingGetter) {
    PropertyTable<ItemModel> table;
    table.add("Value", [](const ItemModel&) { return Value(1); });
    table.add("Value", [](const ItemModel&) { return Value(2); });

    ItemModel item;
    EXPECT_EQ(*table.get(item, "Value"), Value(2));
    EXPECT_EQ(table.names().size(), 1u);
}

// ============================================================================
// Sequence adapters
// ============================================================================

TEST(ValueArray, SnapshotsElements) {
    std::vector<std::string> source = {"a", "b"};
    Value array = make_array(source);
    source.push_back("c");

    const Sequence* seq = array.as_sequence();
    ASSERT_NE(seq, nullptr);
    EXPECT_EQ(seq->size(), 2u);
    EXPECT_EQ(seq->at(1), Value("b"));
}

TEST(SequenceView, SeesContainerChanges) {
    auto source = std::make_shared<std::vector<int>>(std::vector<int>{1, 2});
    Value view = make_view(source);
    source->push_back(3);

    const Sequence* seq = view.as_sequence();
    ASSERT_NE(seq, nullptr);
    EXPECT_EQ(seq->size(), 3u);
    EXPECT_EQ(seq->at(2), Value(3));
}

TEST(SequenceView, KeepsContainerAlive) {
    Value view;
    {
        auto source = std::make_shared<std::vector<std::string>>(std::vector<std::string>{"kept"});
        view = make_view(source);
    }
    EXPECT_EQ(view.as_sequence()->at(0), Value("kept"));
}

TEST(SequenceView, NullContainerIsNullValue) {
    std::shared_ptr<std::vector<int>> none;
    EXPECT_TRUE(make_view(none).is_null());
}
