#include "internal/error/field.hpp"
#include "internal/error/metadata.hpp"
#include "internal/error/redaction.hpp"
#include "internal/util/strings.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include <vector>

namespace {

using faultline::Field;
using faultline::FieldRedaction;
using faultline::FieldValue;
using faultline::Metadata;
namespace field = faultline::field;

void TestCanonicalValueText() {
  assert(FieldValue::Str("abc").ToString() == "abc");
  assert(FieldValue::I64(-7).ToString() == "-7");
  assert(FieldValue::U64(18446744073709551615ULL).ToString() == "18446744073709551615");
  assert(FieldValue::F64(0.25).ToString() == "0.25");
  assert(FieldValue::Bool(true).ToString() == "true");

  assert(FieldValue::Duration(std::chrono::seconds(5)).ToString() == "5s");
  assert(FieldValue::Duration(std::chrono::milliseconds(1500)).ToString() == "1.5s");
  assert(FieldValue::Duration(std::chrono::microseconds(1500)).ToString() == "0.0015s");

  const auto uuid = faultline::util::FromString("123e4567-e89b-12d3-a456-426614174000");
  assert(FieldValue::Uuid(uuid).ToString() == "123e4567-e89b-12d3-a456-426614174000");

  const auto generated = faultline::util::GenerateUUID();
  assert((generated[6] & 0xF0) == 0x40);
  assert((generated[8] & 0xC0) == 0x80);
  assert(faultline::util::FromString(faultline::util::ToString(generated)) == generated);
}

void TestRedactionIsInferredFromNames() {
  assert(faultline::InferRedaction("password") == FieldRedaction::kRedact);
  assert(faultline::InferRedaction("db.PASSWORD") == FieldRedaction::kRedact);
  assert(faultline::InferRedaction("session_id") == FieldRedaction::kRedact);
  assert(faultline::InferRedaction("token") == FieldRedaction::kHash);
  assert(faultline::InferRedaction("refresh_token") == FieldRedaction::kHash);
  assert(faultline::InferRedaction("api_key") == FieldRedaction::kHash);
  assert(faultline::InferRedaction("card_number") == FieldRedaction::kLast4);
  assert(faultline::InferRedaction("account.id") == FieldRedaction::kLast4);
  assert(faultline::InferRedaction("user_id") == FieldRedaction::kNone);
  assert(faultline::InferRedaction("attempt") == FieldRedaction::kNone);

  assert(field::Str("password", "hunter2").Redaction() == FieldRedaction::kRedact);
  assert(field::Str("user_id", "u-1").Redaction() == FieldRedaction::kNone);
  assert(field::Str("user_id", "u-1").WithRedaction(FieldRedaction::kHash).Redaction() == FieldRedaction::kHash);
}

void TestMetadataKeepsNameOrder() {
  std::vector<Field> forward  = {field::U64("b", 2), field::Str("a", "x"), field::Bool("c", true)};
  std::vector<Field> backward = {field::Bool("c", true), field::U64("b", 2), field::Str("a", "x")};

  const auto first  = Metadata::FromFields(forward);
  const auto second = Metadata::FromFields(backward);
  assert(first.Size() == 3);
  assert(second.Size() == 3);

  Metadata reinserted;
  for (const auto& f : second) {
    reinserted.Insert(f);
  }

  auto a = first.begin();
  auto b = reinserted.begin();
  for (; a != first.end(); ++a, ++b) {
    assert(a->Name() == b->Name());
    assert(a->Value() == b->Value());
  }
  assert(first.Fields().front().Name() == "a");
  assert(first.Fields().back().Name() == "c");
}

void TestInsertReplacesAndReturnsPrevious() {
  Metadata metadata;
  assert(!metadata.Insert(field::I64("attempt", 1)));
  const auto previous = metadata.Insert(field::I64("attempt", 2));
  assert(previous && *previous->AsI64() == 1);
  assert(metadata.Size() == 1);
  assert(*metadata.Get("attempt")->AsI64() == 2);
  assert(metadata.Get("missing") == nullptr);

  std::vector<Field> more = {field::Str("region", "eu"), field::F64("ratio", 0.5)};
  metadata.Extend(more);
  assert(metadata.Size() == 3);
}

void TestRedactionPolicyAppliesBeforeAndAfterInsert() {
  Metadata metadata;
  metadata.Insert(field::Str("email", "a@b.c"));
  metadata.SetRedaction("email", FieldRedaction::kHash);
  assert(metadata.GetField("email")->Redaction() == FieldRedaction::kHash);

  // A policy registered first tags later inserts under the same name.
  metadata.SetRedaction("phone", FieldRedaction::kLast4);
  assert(metadata.Redaction("phone") == FieldRedaction::kLast4);
  metadata.Insert(field::Str("phone", "5551234567"));
  assert(metadata.GetField("phone")->Redaction() == FieldRedaction::kLast4);

  // Re-inserting keeps the registered policy instead of the inferred one.
  metadata.Insert(field::Str("email", "x@y.z"));
  assert(metadata.GetField("email")->Redaction() == FieldRedaction::kHash);

  assert(!metadata.Redaction("absent"));
}

void TestSanitizedValues() {
  namespace redaction = faultline::redaction;

  assert(redaction::Sha256Hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  assert(redaction::MaskLast4("4111111111111111") == "************1111");
  assert(redaction::MaskLast4("1234") == "***4");
  assert(redaction::MaskLast4("") == "");

  // Masking counts code points, not bytes.
  assert(redaction::MaskLast4("\u30ab\u30fc\u30c9\u756a\u53f7") == "*\u30fc\u30c9\u756a\u53f7");
  assert(redaction::MaskLast4("\u65e5\u672c") == "*\u672c");
  const auto kana = redaction::SanitizedValue(Field("card", FieldValue::Str("\u30ab\u30fc\u30c9\u756a\u53f7"), FieldRedaction::kLast4));
  assert(kana && *kana == "*\u30fc\u30c9\u756a\u53f7");

  assert(*redaction::SanitizedValue(field::Str("user_id", "u-1")) == "u-1");
  assert(!redaction::SanitizedValue(field::Str("password", "hunter2")));

  const auto hashed = redaction::SanitizedValue(field::Str("token", "super-secret"));
  assert(hashed && hashed->size() == 64);
  assert(hashed->find("super-secret") == std::string::npos);

  const auto masked = redaction::SanitizedValue(field::Str("card_number", "4111111111111111"));
  assert(masked && masked->find("41111111") == std::string::npos);
  assert(masked->substr(masked->size() - 4) == "1111");

  assert(!redaction::SanitizedValue(Field("flag", FieldValue::Bool(true), FieldRedaction::kLast4)));
}

void TestAsciiStringHelpers() {
  namespace util = faultline::util;

  assert(util::Trim("  staging\t\n") == "staging");
  assert(util::Trim(" \r\n ").empty());
  assert(util::EqualsIgnoreCase("OFF", "off"));
  assert(!util::EqualsIgnoreCase("of", "off"));
  assert(util::ContainsIgnoreCase("X-Session-Id", "session"));
  assert(util::EndsWithIgnoreCase("RefreshToken", "token"));
  assert(!util::EndsWithIgnoreCase("tok", "token"));
}

void TestHashDigestsTypedBytes() {
  namespace redaction = faultline::redaction;

  assert(redaction::HashFieldValue(FieldValue::I64(42)) == redaction::Sha256Hex("42"));
  assert(redaction::HashFieldValue(FieldValue::Bool(false)) == redaction::Sha256Hex("false"));

  // 1.5 is 0x3FF8000000000000, digested little-endian.
  const std::string float_bytes("\x00\x00\x00\x00\x00\x00\xF8\x3F", 8);
  assert(redaction::HashFieldValue(FieldValue::F64(1.5)) == redaction::Sha256Hex(float_bytes));

  // Whole seconds as 8 bytes then sub-second nanoseconds as 4 bytes.
  const std::string duration_bytes("\x02\x00\x00\x00\x00\x00\x00\x00\x05\x00\x00\x00", 12);
  const auto        duration = std::chrono::seconds(2) + std::chrono::nanoseconds(5);
  assert(redaction::HashFieldValue(FieldValue::Duration(duration)) == redaction::Sha256Hex(duration_bytes));

  const auto hashed = redaction::SanitizedValue(Field("ratio", FieldValue::F64(1.5), FieldRedaction::kHash));
  assert(hashed && *hashed == redaction::Sha256Hex(float_bytes));
}

} // namespace

int main() {
  TestCanonicalValueText();
  TestRedactionIsInferredFromNames();
  TestMetadataKeepsNameOrder();
  TestInsertReplacesAndReturnsPrevious();
  TestRedactionPolicyAppliesBeforeAndAfterInsert();
  TestSanitizedValues();
  TestHashDigestsTypedBytes();
  TestAsciiStringHelpers();

  std::cout << "faultline_unit_field_metadata: pass\n";
  return 0;
}
