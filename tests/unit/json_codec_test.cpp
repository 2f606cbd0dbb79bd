#include "internal/util/json.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using google::protobuf::Value;
using namespace offline::util;

Value Nest(int levels) {
  Value v = StringValue("leaf");
  for (int i = 0; i < levels; ++i) {
    v = ListValue({v});
  }
  return v;
}

void TestStructSurvivesEncoding() {
  const auto original = StructValue({
      {"title", StringValue("Field guide")},
      {"pages", NumberValue(212)},
      {"draft", BoolValue(false)},
      {"tags", ListValue({StringValue("a"), StringValue("b")})},
      {"notes", NullValue()},
  });

  const auto decoded = FromJson(ToJson(original));
  assert(Equal(original, decoded));
  assert(Field(decoded, "title")->string_value() == "Field guide");
  assert(Field(decoded, "pages")->number_value() == 212);
  assert(IsNull(*Field(decoded, "notes")));
  assert(!Field(decoded, "missing").has_value());
}

void TestFieldOnNonStructIsEmpty() {
  assert(!Field(StringValue("x"), "x").has_value());
  assert(!Field(ListValue({}), "x").has_value());
}

void TestNonFiniteNumbersAreRejected() {
  bool threw = false;
  try {
    ToJson(StructValue({{"n", NumberValue(std::numeric_limits<double>::quiet_NaN())}}));
  } catch (const SerializationError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    ToJson(NumberValue(std::numeric_limits<double>::infinity()));
  } catch (const SerializationError&) {
    threw = true;
  }
  assert(threw);
}

void TestUnsetValueIsRejected() {
  bool threw = false;
  try {
    ToJson(Value{});
  } catch (const SerializationError&) {
    threw = true;
  }
  assert(threw);
}

void TestNestingLimit() {
  assert(Equal(FromJson(ToJson(Nest(16))), Nest(16)));

  bool threw = false;
  try {
    ToJson(Nest(kMaxJsonDepth + 1));
  } catch (const SerializationError&) {
    threw = true;
  }
  assert(threw);
}

void TestMalformedJsonIsRejected() {
  bool threw = false;
  try {
    FromJson("{\"open\": ");
  } catch (const SerializationError&) {
    threw = true;
  }
  assert(threw);
}

void TestEqualityIsDeep() {
  const auto a = StructValue({{"inner", StructValue({{"x", NumberValue(1)}})}});
  const auto b = StructValue({{"inner", StructValue({{"x", NumberValue(1)}})}});
  const auto c = StructValue({{"inner", StructValue({{"x", NumberValue(2)}})}});
  assert(Equal(a, b));
  assert(!Equal(a, c));
}

} // namespace

int main() {
  TestStructSurvivesEncoding();
  TestFieldOnNonStructIsEmpty();
  TestNonFiniteNumbersAreRejected();
  TestUnsetValueIsRejected();
  TestNestingLimit();
  TestMalformedJsonIsRejected();
  TestEqualityIsDeep();

  std::cout << "offline_sync_unit_json_codec: pass\n";
  return 0;
}
