/*
 * taintguard C++17 - Shared type tests
 */
#include <gtest/gtest.h>
#include <taintguard/leakage/types.hpp>

using namespace taintguard;

// ============================================================================
// TaintType
// ============================================================================

TEST(TaintTypeTest, ToString_BuiltinKinds) {
    EXPECT_EQ("pii", TaintType::pii().to_string());
    EXPECT_EQ("credential", TaintType::credential().to_string());
    EXPECT_EQ("proprietary_source", TaintType::proprietary_source().to_string());
    EXPECT_EQ("system_prompt_canary", TaintType::system_prompt_canary().to_string());
}

TEST(TaintTypeTest, ToString_CustomCarriesName) {
    EXPECT_EQ("custom:medical_record", TaintType::custom("medical_record").to_string());
}

TEST(TaintTypeTest, Placeholder_PerKind) {
    EXPECT_EQ("[REDACTED:PII]", TaintType::pii().placeholder());
    EXPECT_EQ("[REDACTED:CREDENTIAL]", TaintType::credential().placeholder());
    EXPECT_EQ("[REDACTED:PROPRIETARY]", TaintType::proprietary_source().placeholder());
    EXPECT_EQ("[REDACTED:CANARY]", TaintType::system_prompt_canary().placeholder());
    EXPECT_EQ("[REDACTED:MEDICAL_RECORD]", TaintType::custom("medical_record").placeholder());
}

TEST(TaintTypeTest, Parse_RoundTripsAndAliases) {
    TaintType t;
    ASSERT_TRUE(TaintType::parse("credential", t));
    EXPECT_EQ(TaintType::credential(), t);
    ASSERT_TRUE(TaintType::parse("  PII ", t));
    EXPECT_EQ(TaintType::pii(), t);
    ASSERT_TRUE(TaintType::parse("proprietary", t));
    EXPECT_EQ(TaintType::proprietary_source(), t);
    ASSERT_TRUE(TaintType::parse("canary", t));
    EXPECT_EQ(TaintType::system_prompt_canary(), t);
    ASSERT_TRUE(TaintType::parse("custom:Payroll", t));
    EXPECT_EQ(TaintKind::Custom, t.kind);
    EXPECT_EQ("Payroll", t.custom_name);
}

TEST(TaintTypeTest, Parse_RejectsUnknown) {
    TaintType t;
    EXPECT_FALSE(TaintType::parse("secret", t));
    EXPECT_FALSE(TaintType::parse("custom:", t));
    EXPECT_FALSE(TaintType::parse("", t));
}

TEST(TaintTypeTest, Equality_ComparesCustomName) {
    EXPECT_EQ(TaintType::custom("a"), TaintType::custom("a"));
    EXPECT_NE(TaintType::custom("a"), TaintType::custom("b"));
    EXPECT_NE(TaintType::pii(), TaintType::credential());
    // The name is ignored for non-custom kinds
    EXPECT_EQ(TaintType::pii(), TaintType(TaintKind::Pii, "ignored"));
}

// ============================================================================
// Enum conversions
// ============================================================================

TEST(LeakageEnumsTest, SeverityParseAndOrdering) {
    AuditSeverity s;
    ASSERT_TRUE(parse_severity("warn", s));
    EXPECT_EQ(AuditSeverity::Warning, s);
    ASSERT_TRUE(parse_severity("Critical", s));
    EXPECT_EQ(AuditSeverity::Critical, s);
    EXPECT_FALSE(parse_severity("fatal", s));

    EXPECT_TRUE(at_least(AuditSeverity::Critical, AuditSeverity::Warning));
    EXPECT_TRUE(at_least(AuditSeverity::Warning, AuditSeverity::Warning));
    EXPECT_FALSE(at_least(AuditSeverity::Info, AuditSeverity::Warning));
}

TEST(LeakageEnumsTest, VectorAndDecisionNames) {
    EXPECT_STREQ("canary_leak", to_string(LeakageVector::CanaryLeak));
    EXPECT_STREQ("prompt_injection", to_string(LeakageVector::PromptInjection));
    EXPECT_STREQ("redact", to_string(Decision::Redact));
    EXPECT_STREQ("modify", to_string(InterceptDecision::Modify));
    EXPECT_STREQ("flag", to_string(AuditDecision::Flag));
    EXPECT_STREQ("registry_full", to_string(LeakageError::RegistryFull));
    EXPECT_STREQ("decoded_variant", to_string(MatchConfidence::DecodedVariant));

    LeakageVector v;
    ASSERT_TRUE(parse_vector("tool_argument", v));
    EXPECT_EQ(LeakageVector::ToolArgument, v);
    AuditDecision d;
    ASSERT_TRUE(parse_audit_decision("MODIFY", d));
    EXPECT_EQ(AuditDecision::Modify, d);
}

TEST(LeakageEnumsTest, UniqueEntryIds_KeepsFirstOccurrenceOrder) {
    std::vector<TaintMatch> matches(4);
    matches[0].entry_id = "b";
    matches[1].entry_id = "a";
    matches[2].entry_id = "b";
    matches[3].entry_id = "c";

    std::vector<std::string> ids = unique_entry_ids(matches);
    ASSERT_EQ(3u, ids.size());
    EXPECT_EQ("b", ids[0]);
    EXPECT_EQ("a", ids[1]);
    EXPECT_EQ("c", ids[2]);
}
