#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "Errors.hpp"
#include "Record.hpp"
#include <limits>

using namespace sqlkit;
using ::testing::HasSubstr;

namespace {

struct User {
    int64_t id = 0;
    std::string name;
    int age = 0;
    std::optional<std::string> email;
};

const RecordType<User> kUserType("User", {
    field("id", &User::id),
    field("name", &User::name),
    field("age", &User::age),
    field("email", &User::email),
});

}  // namespace

class RecordTest : public ::testing::Test {
protected:
    void SetUp() override {
        result_.columns = {"id", "name", "age"};
        result_.rows = {
            {Value(1), Value("alice"), Value(31)},
            {Value(2), Value("bob"), Value(27)},
        };
    }

    QueryResult result_;
};

// Record tests

TEST_F(RecordTest, SetKeepsInsertionOrder) {
    Record record;
    record.set("b", Value(2));
    record.set("a", Value(1));

    ASSERT_EQ(record.size(), 2u);
    EXPECT_EQ(record.fields()[0].first, "b");
    EXPECT_EQ(record.fields()[1].first, "a");
}

TEST_F(RecordTest, SetReplacesExistingField) {
    Record record;
    record.set("x", Value(1));
    record.set("x", Value("one"));

    EXPECT_EQ(record.size(), 1u);
    EXPECT_EQ(record["x"], Value("one"));
}

TEST_F(RecordTest, LookupOfMissingField) {
    Record record;
    record.set("x", Value(1));

    EXPECT_TRUE(record.contains("x"));
    EXPECT_FALSE(record.contains("y"));
    EXPECT_EQ(record.find("y"), nullptr);
    EXPECT_THROW(record.at("y"), std::out_of_range);
}

TEST_F(RecordTest, TypedGet) {
    Record record;
    record.set("n", Value(42));
    record.set("s", Value("text"));
    record.set("missing", Value());

    EXPECT_EQ(record.get<int64_t>("n"), 42);
    EXPECT_DOUBLE_EQ(record.get<double>("n"), 42.0);
    EXPECT_EQ(record.get<std::string>("s"), "text");
    EXPECT_FALSE(record.get<std::optional<int64_t>>("missing").has_value());
    EXPECT_THROW(record.get<int64_t>("s"), std::invalid_argument);
}

// Conversion tests

TEST_F(RecordTest, BooleanConversion) {
    bool out = false;
    EXPECT_TRUE(fromValue(Value(true), out));
    EXPECT_TRUE(out);
    EXPECT_TRUE(fromValue(Value(0), out));
    EXPECT_FALSE(out);
    EXPECT_FALSE(fromValue(Value(2), out));
    EXPECT_FALSE(fromValue(Value("true"), out));
}

TEST_F(RecordTest, IntegerConversionChecksRange) {
    int small = 0;
    EXPECT_TRUE(fromValue(Value(int64_t(123)), small));
    EXPECT_EQ(small, 123);

    int64_t big = static_cast<int64_t>(std::numeric_limits<int>::max()) + 1;
    EXPECT_FALSE(fromValue(Value(big), small));
    EXPECT_EQ(small, 123);
}

TEST_F(RecordTest, WideIntegerConversion) {
    int64_t narrow = 0;
    EXPECT_TRUE(fromValue(Value(static_cast<WideInt>(99)), narrow));
    EXPECT_EQ(narrow, 99);

    WideInt huge = wideIntFromParts(1, 0);
    EXPECT_FALSE(fromValue(Value(huge), narrow));

    WideInt wide = 0;
    EXPECT_TRUE(fromValue(Value(int64_t(-5)), wide));
    EXPECT_TRUE(wide == -5);
}

TEST_F(RecordTest, TextAndBlobDoNotCoerce) {
    std::string text;
    Blob blob;
    EXPECT_FALSE(fromValue(Value(7), text));
    EXPECT_FALSE(fromValue(Value("abc"), blob));
    EXPECT_TRUE(fromValue(Value(Blob{1, 2}), blob));
    EXPECT_EQ(blob, (Blob{1, 2}));
}

// Generic materialization tests

TEST_F(RecordTest, MaterializeWithKnownColumns) {
    MaterializeOptions opts;
    opts.knownColumns = {"id", "name", "age"};

    std::vector<Record> records = materialize(result_, opts);

    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0]["name"], Value("alice"));
    EXPECT_EQ(records[1]["age"], Value(27));
}

TEST_F(RecordTest, MaterializeRejectsUnknownColumn) {
    MaterializeOptions opts;
    opts.knownColumns = {"id", "name"};

    try {
        materialize(result_, opts);
        FAIL() << "expected UnknownColumnNameError";
    } catch (const UnknownColumnNameError& e) {
        EXPECT_EQ(e.error().column, "age");
        EXPECT_STREQ(e.what(), "column 'age' is not a known identifier");
    }
}

TEST_F(RecordTest, MaterializeWithDynamicFields) {
    MaterializeOptions opts;
    opts.allowDynamicFieldCreation = true;

    std::vector<Record> records = materialize(result_, opts);

    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].size(), 3u);
}

TEST_F(RecordTest, MaterializeEmptyResult) {
    result_.rows.clear();
    EXPECT_TRUE(materialize(result_, MaterializeOptions{{}, true}).empty());
}

// Typed materialization tests

TEST_F(RecordTest, TypedMaterialization) {
    std::vector<User> users = materialize(result_, kUserType);

    ASSERT_EQ(users.size(), 2u);
    EXPECT_EQ(users[0].id, 1);
    EXPECT_EQ(users[0].name, "alice");
    EXPECT_EQ(users[1].age, 27);
    EXPECT_FALSE(users[1].email.has_value());
}

TEST_F(RecordTest, TypedMaterializationFillsOptional) {
    result_.columns.push_back("email");
    result_.rows[0].push_back(Value("alice@example.com"));
    result_.rows[1].push_back(Value());

    std::vector<User> users = materialize(result_, kUserType);

    EXPECT_EQ(users[0].email, std::optional<std::string>("alice@example.com"));
    EXPECT_FALSE(users[1].email.has_value());
}

TEST_F(RecordTest, TypedMaterializationRejectsUndeclaredColumn) {
    result_.columns[2] = "height";

    try {
        materialize(result_, kUserType);
        FAIL() << "expected RecordConstructionError";
    } catch (const RecordConstructionError& e) {
        EXPECT_EQ(e.error().column, "height");
        EXPECT_THAT(e.what(), HasSubstr("cannot build User from column 'height'"));
    }
}

TEST_F(RecordTest, TypedMaterializationRejectsBadConversion) {
    result_.rows[1][2] = Value("old");

    try {
        materialize(result_, kUserType);
        FAIL() << "expected RecordConstructionError";
    } catch (const RecordConstructionError& e) {
        EXPECT_EQ(e.error().column, "age");
        EXPECT_EQ(e.error().cause, "cannot convert a text value");
    }
}

TEST_F(RecordTest, ConstructFromRecord) {
    Record record;
    record.set("name", Value("zoe"));
    record.set("age", Value(8));

    User user = kUserType.construct(record);

    EXPECT_EQ(user.name, "zoe");
    EXPECT_EQ(user.age, 8);
    EXPECT_EQ(user.id, 0);
}
