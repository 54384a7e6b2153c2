#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "enumkit/core/item_factory.hpp"

using namespace enumkit::core;

class EnumItemTest : public ::testing::Test {
protected:
    json payload_{{"Hex", "#FF0000"}, {"Weight", 3}, {"Tags", {"warm", "primary"}}};
};

// Construction Tests
TEST_F(EnumItemTest, CarriesNameTypeAndData) {
    auto item = ItemFactory::createItem("Color", "Red", payload_);

    EXPECT_TRUE(item.valid());
    EXPECT_EQ(item.name(), "Red");
    EXPECT_EQ(item.enumType(), "Color");
    EXPECT_EQ(item.data(), payload_);
    for (const auto& entry : payload_.items()) {
        ASSERT_TRUE(item.has(entry.key()));
        EXPECT_EQ(item.get(entry.key()).value(), entry.value());
    }
}

TEST_F(EnumItemTest, DefaultsToEmptyData) {
    auto item = ItemFactory::createItem("Color", "Red");
    EXPECT_TRUE(item.data().is_object());
    EXPECT_TRUE(item.data().empty());
}

TEST_F(EnumItemTest, NullDataIsEmpty) {
    auto item = ItemFactory::createItem("Color", "Red", nullptr);
    EXPECT_TRUE(item.data().is_object());
    EXPECT_TRUE(item.data().empty());
}

TEST_F(EnumItemTest, DataIsCopiedAtCreation) {
    json data{{"Hex", "#00FF00"}};
    auto item = ItemFactory::createItem("Color", "Green", data);
    data["Hex"] = "changed";
    data["Extra"] = true;

    EXPECT_EQ(item.value<std::string>("Hex"), "#00FF00");
    EXPECT_FALSE(item.has("Extra"));
}

TEST_F(EnumItemTest, ExposesNoMutation) {
    using DataRef = decltype(std::declval<const EnumItem&>().data());
    static_assert(std::is_const_v<std::remove_reference_t<DataRef>>);
    using NameRef = decltype(std::declval<const EnumItem&>().name());
    static_assert(std::is_const_v<std::remove_reference_t<NameRef>>);
    SUCCEED();
}

// Attribute Access Tests
TEST_F(EnumItemTest, ReservedKeysAreReadable) {
    auto item = ItemFactory::createItem("Color", "Red", payload_);
    EXPECT_TRUE(item.has("Name"));
    EXPECT_TRUE(item.has("EnumType"));
    EXPECT_EQ(item.get("Name").value(), json("Red"));
    EXPECT_EQ(item.get("EnumType").value(), json("Color"));
    EXPECT_FALSE(item.data().contains("Name"));
}

TEST_F(EnumItemTest, MissingAttribute) {
    auto item = ItemFactory::createItem("Color", "Red", payload_);
    EXPECT_FALSE(item.has("Missing"));
    EXPECT_FALSE(item.get("Missing").has_value());
    EXPECT_THROW((void)item.value<int>("Missing"), ItemNotFound);
}

TEST_F(EnumItemTest, TypedValue) {
    auto item = ItemFactory::createItem("Color", "Red", payload_);
    EXPECT_EQ(item.value<int>("Weight"), 3);
    EXPECT_EQ(item.value<std::string>("Name"), "Red");
    auto tags = item.value<std::vector<std::string>>("Tags");
    ASSERT_EQ(tags.size(), 2U);
    EXPECT_EQ(tags[0], "warm");
    EXPECT_THROW((void)item.value<int>("Hex"), InvalidArgumentType);
}

// Identity Tests
TEST_F(EnumItemTest, SeparatelyCreatedItemsDiffer) {
    auto first = ItemFactory::createItem("T", "A");
    auto second = ItemFactory::createItem("T", "A");

    EXPECT_NE(first, second);
    EXPECT_NE(first.identity(), second.identity());
}

TEST_F(EnumItemTest, CopiesKeepIdentity) {
    auto original = ItemFactory::createItem("T", "A", payload_);
    EnumItem copy = original;
    EnumItem moved = std::move(copy);

    EXPECT_EQ(original, moved);
    EXPECT_EQ(original.identity(), moved.identity());
}

TEST_F(EnumItemTest, EmptyHandle) {
    EnumItem empty;
    auto item = ItemFactory::createItem("T", "A");

    EXPECT_FALSE(empty.valid());
    EXPECT_FALSE(static_cast<bool>(empty));
    EXPECT_EQ(empty.identity(), NULL_IDENTITY);
    EXPECT_NE(empty, item);
    EXPECT_EQ(empty, EnumItem{});
    EXPECT_THROW((void)empty.name(), InvalidArgumentType);
    EXPECT_EQ(empty.toString(), "Enum.<empty>");
}

TEST_F(EnumItemTest, HashFollowsIdentity) {
    auto first = ItemFactory::createItem("T", "A");
    auto second = ItemFactory::createItem("T", "A");

    std::unordered_set<EnumItem> items{first, first, second};
    EXPECT_EQ(items.size(), 2U);
    EXPECT_TRUE(items.contains(first));
}

// Rendering Tests
TEST_F(EnumItemTest, Rendering) {
    auto item = ItemFactory::createItem("Color", "Red");
    EXPECT_EQ(item.toString(), "Enum.Color.Red");
    EXPECT_EQ(fmt::format("{}", item), "Enum.Color.Red");

    std::ostringstream oss;
    oss << item;
    EXPECT_EQ(oss.str(), "Enum.Color.Red");
}

// Validation Tests
TEST_F(EnumItemTest, RejectsEmptyEnumType) {
    EXPECT_THROW((void)ItemFactory::createItem("", "Red"), InvalidArgumentType);
}

TEST_F(EnumItemTest, AcceptsEmptyName) {
    auto item = ItemFactory::createItem("Color", "");
    EXPECT_TRUE(item.valid());
    EXPECT_EQ(item.name(), "");
    EXPECT_EQ(item.toString(), "Enum.Color.");
}

TEST_F(EnumItemTest, RejectsNonObjectData) {
    EXPECT_THROW((void)ItemFactory::createItem("Color", "Red", json::array()),
                 InvalidArgumentType);
    EXPECT_THROW((void)ItemFactory::createItem("Color", "Red", 5),
                 InvalidArgumentType);
    EXPECT_THROW((void)ItemFactory::createItem("Color", "Red", "text"),
                 InvalidArgumentType);
}

TEST_F(EnumItemTest, RejectsReservedKeys) {
    EXPECT_THROW((void)ItemFactory::createItem("Color", "Red", {{"Name", "x"}}),
                 ReservedKeyError);
    EXPECT_THROW(
        (void)ItemFactory::createItem("Color", "Red", {{"EnumType", "Other"}}),
        ReservedKeyError);
}

TEST_F(EnumItemTest, ReservedKeyMessageNamesKey) {
    try {
        (void)ItemFactory::createItem("Color", "Red", {{"EnumType", "x"}});
        FAIL() << "Expected ReservedKeyError";
    } catch (const ReservedKeyError& e) {
        EXPECT_NE(e.getMessage().find("EnumType"), std::string::npos);
        EXPECT_NE(e.getMessage().find("Color.Red"), std::string::npos);
    }
}
