/**
 * @file test_normalize.cpp
 * @brief Tests for sequence normalization
 */

#include <gtest/gtest.h>
#include "doctree/Normalize.hpp"
#include "doctree/Errors.hpp"
#include "RecordingDiagnostics.hpp"

using namespace doctree;

// ============================================================================
// Scalars and singleton sequences
// ============================================================================

TEST(Normalize, SingletonStringCollapses) {
    EXPECT_EQ(normalize({{"tags", {"solo"}}}), (Value{{"tags", "solo"}}));
}

TEST(Normalize, SingletonScalarsCollapse) {
    const std::vector<Value> scalars = {Value("s"), Value(3), Value(std::int64_t{1} << 35),
                                        Value(false), make_date(86400000)};
    for (const auto& scalar : scalars) {
        Value doc = Value::object();
        doc["field"] = Value::array({scalar});
        Value expected = Value::object();
        expected["field"] = scalar;
        EXPECT_EQ(normalize(doc), expected) << scalar.dump();
    }
}

TEST(Normalize, ScalarsCopied) {
    Value doc = {{"a", "x"}, {"b", 1}, {"c", true}};
    EXPECT_EQ(normalize(doc), doc);
}

TEST(Normalize, EmptySequenceKept) {
    Value result = normalize({{"field", Value::array()}, {"other", 1}});
    ASSERT_TRUE(result.contains("field"));
    EXPECT_EQ(result["field"], Value::array());
    EXPECT_EQ(result["other"], 1);
}

TEST(Normalize, NullYieldsNull) {
    EXPECT_TRUE(normalize(Value()).is_null());
}

TEST(Normalize, NonDocumentThrows) {
    EXPECT_THROW(normalize(Value::array({1})), TypeError);
}

// ============================================================================
// Sequence reduction
// ============================================================================

TEST(Normalize, DocumentListTakesFirstElement) {
    Value doc = {{"authors", {{{"name", "Asimov"}}, {{"name", "Clarke"}}}}};
    EXPECT_EQ(normalize(doc), (Value{{"authors", {{"name", "Asimov"}}}}));
}

TEST(Normalize, RepresentativeElementIsNormalized) {
    Value doc = {{"items", {{{"tags", {"x"}}, {"n", 1}}}}};
    EXPECT_EQ(normalize(doc), (Value{{"items", {{"tags", "x"}, {"n", 1}}}}));
}

TEST(Normalize, NestedSequenceUsesInnerFirstDocument) {
    Value inner = Value::array({Value{{"k", {"v"}}}, Value{{"k", "ignored"}}});
    Value doc = Value::object();
    doc["grid"] = Value::array({inner, Value::array()});
    EXPECT_EQ(normalize(doc), (Value{{"grid", {{"k", "v"}}}}));
}

TEST(Normalize, ScalarLedSequenceBecomesPair) {
    Value doc = {{"pair", {"key", 42, "rest"}}};
    EXPECT_EQ(normalize(doc), (Value{{"pair", {{"key", 42}}}}));
}

TEST(Normalize, IntegerLedSequenceUsesTextKey) {
    Value doc = {{"pair", {7, "seven"}}};
    EXPECT_EQ(normalize(doc), (Value{{"pair", {{"7", "seven"}}}}));
}

TEST(Normalize, NestedDocumentsRecurse) {
    Value doc = {{"outer", {{"inner", {{"list", {1}}}}}}};
    EXPECT_EQ(normalize(doc), (Value{{"outer", {{"inner", {{"list", 1}}}}}}));
}

TEST(Normalize, InputUnchanged) {
    const Value doc = {{"tags", {"solo"}}, {"n", {{"l", {{{"a", 1}}}}}}};
    const Value copy = doc;
    (void)normalize(doc);
    EXPECT_EQ(doc, copy);
}

// ============================================================================
// Malformed sequences
// ============================================================================

TEST(NormalizeMalformed, SingletonUnrecognizedElement) {
    Value doc = Value::object();
    doc["f"] = Value::array({Value(1.5)});
    try {
        normalize(doc);
        FAIL() << "Expected MalformedSequence";
    } catch (const MalformedSequence& e) {
        EXPECT_EQ(e.path(), "f");
        EXPECT_EQ(e.size(), 1u);
    }
}

TEST(NormalizeMalformed, ObjectIdLedSequence) {
    Value doc = Value::object();
    doc["f"] = Value::array({make_object_id("abc"), 1});
    try {
        normalize(doc);
        FAIL() << "Expected MalformedSequence";
    } catch (const MalformedSequence& e) {
        EXPECT_EQ(e.path(), "f");
        EXPECT_EQ(e.size(), 2u);
    }
}

TEST(NormalizeMalformed, NullLedSequence) {
    Value doc = Value::object();
    doc["f"] = Value::array({Value(), 1});
    EXPECT_THROW(normalize(doc), MalformedSequence);
    EXPECT_THROW(reduce_sequence(Value::array({0.5, "half"})), MalformedSequence);
}

TEST(NormalizeMalformed, NestedSequenceWithoutDocument) {
    Value doc = Value::object();
    doc["f"] = Value::array({Value::array({1, 2}), 3});
    EXPECT_THROW(normalize(doc), MalformedSequence);
}

TEST(NormalizeMalformed, EmptyNestedSequence) {
    Value doc = Value::object();
    doc["f"] = Value::array({Value::array()});
    EXPECT_THROW(normalize(doc), MalformedSequence);
}

TEST(NormalizeMalformed, PathOfNestedField) {
    Value doc = Value::object();
    doc["a"]["b"] = Value::array({Value()});
    try {
        normalize(doc);
        FAIL() << "Expected MalformedSequence";
    } catch (const MalformedSequence& e) {
        EXPECT_EQ(e.path(), "a.b");
    }
}

// ============================================================================
// Unrecognized values
// ============================================================================

TEST(Normalize, UnrecognizedFieldsDropped) {
    RecordingDiagnostics diag;
    Options options;
    options.diagnostics = &diag;

    Value doc = Value::object();
    doc["keep"] = "x";
    doc["ratio"] = 0.5;
    doc["missing"] = nullptr;
    doc["_id"] = make_object_id("507f1f77bcf86cd799439011");
    doc["when"] = make_date("2024-01-02");

    Value result = normalize(doc, options);

    EXPECT_EQ(result, (Value{{"keep", "x"}, {"when", make_date("2024-01-02")}}));
    EXPECT_EQ(diag.dropped, (std::vector<std::string>{"ratio", "missing", "_id"}));
}

// ============================================================================
// reduce_sequence
// ============================================================================

TEST(ReduceSequence, Direct) {
    EXPECT_EQ(reduce_sequence(Value::array({Value{{"a", {1}}}})), (Value{{"a", 1}}));
    EXPECT_EQ(reduce_sequence(Value::array({true, "v"})), (Value{{"true", "v"}}));
}

TEST(ReduceSequence, EmptyThrows) {
    EXPECT_THROW(reduce_sequence(Value::array()), MalformedSequence);
}

TEST(ReduceSequence, NullAndWrongType) {
    EXPECT_TRUE(reduce_sequence(Value()).is_null());
    EXPECT_THROW(reduce_sequence(Value{{"a", 1}}), TypeError);
}

TEST(ReduceSequence, SingleScalarThrows) {
    EXPECT_THROW(reduce_sequence(Value::array({"alone"})), MalformedSequence);
}
