/*
 * taintguard C++17 - Taint registry tests
 */
#include <gtest/gtest.h>
#include <taintguard/leakage/taint.hpp>

#include <atomic>
#include <chrono>
#include <thread>

using namespace taintguard;

class TaintRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(registry_.begin_session("s1").success);
    }

    std::string mark_ok(const std::string& value, const TaintType& type, const std::string& label = "") {
        MarkResult r = registry_.mark("s1", value, type, label);
        EXPECT_TRUE(r.success) << r.message;
        return r.entry_id;
    }

    TaintRegistry registry_;
};

// ============================================================================
// Sessions
// ============================================================================

TEST_F(TaintRegistryTest, BeginSession_IdempotentWhileLive) {
    SessionResult first = registry_.begin_session("s2");
    ASSERT_TRUE(first.success);
    EXPECT_TRUE(first.created);

    SessionResult again = registry_.begin_session("s2");
    ASSERT_TRUE(again.success);
    EXPECT_FALSE(again.created);
    EXPECT_EQ(first.canary.token, again.canary.token);
    EXPECT_EQ(2u, registry_.session_count());
}

TEST_F(TaintRegistryTest, BeginSession_RejectsEmptyId) {
    SessionResult r = registry_.begin_session("");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(LeakageError::InvalidSession, r.error);
}

TEST_F(TaintRegistryTest, BeginSession_AfterRevokeStartsFresh) {
    CanaryToken old;
    ASSERT_TRUE(registry_.canary_for("s1", old));
    mark_ok("jdoe@example.com", TaintType::pii());
    registry_.revoke_session("s1");

    SessionResult fresh = registry_.begin_session("s1");
    ASSERT_TRUE(fresh.success);
    EXPECT_TRUE(fresh.created);
    EXPECT_NE(old.token, fresh.canary.token);
    EXPECT_EQ(0u, registry_.entry_count("s1"));
}

// ============================================================================
// Marking
// ============================================================================

TEST_F(TaintRegistryTest, Mark_UnknownSessionFails) {
    MarkResult r = registry_.mark("nope", "jdoe@example.com", TaintType::pii());
    EXPECT_FALSE(r.success);
    EXPECT_EQ(LeakageError::InvalidSession, r.error);
}

TEST_F(TaintRegistryTest, Mark_RejectsInvalidValues) {
    EXPECT_EQ(LeakageError::InvalidValue, registry_.mark("s1", "", TaintType::pii()).error);
    EXPECT_EQ(LeakageError::InvalidValue, registry_.mark("s1", "ab", TaintType::pii()).error);
    EXPECT_EQ(LeakageError::InvalidValue, registry_.mark("s1", "    ", TaintType::pii()).error);
    EXPECT_EQ(LeakageError::InvalidValue, registry_.mark("s1", "value", TaintType::custom("")).error);
    EXPECT_EQ(0u, registry_.entry_count("s1"));
}

TEST_F(TaintRegistryTest, Mark_RegistryFullAtCap) {
    RegistryConfig cfg;
    cfg.max_entries_per_session = 2;
    TaintRegistry small(cfg);
    ASSERT_TRUE(small.begin_session("s").success);

    EXPECT_TRUE(small.mark("s", "first-value", TaintType::pii()).success);
    EXPECT_TRUE(small.mark("s", "second-value", TaintType::pii()).success);
    MarkResult third = small.mark("s", "third-value", TaintType::pii());
    EXPECT_FALSE(third.success);
    EXPECT_EQ(LeakageError::RegistryFull, third.error);
    EXPECT_EQ(2u, small.entry_count("s"));
}

TEST_F(TaintRegistryTest, Mark_CredentialsAreHashOnly) {
    std::string cred = mark_ok("acct-555-TOP-SECRET", TaintType::credential(), "bank account");
    std::string pii = mark_ok("jdoe@example.com", TaintType::pii());

    std::vector<TaintEntryInfo> entries = registry_.list_entries("s1");
    ASSERT_EQ(2u, entries.size());
    for (size_t i = 0; i < entries.size(); ++i) {
        if (entries[i].id == cred) {
            EXPECT_TRUE(entries[i].hashed);
            EXPECT_EQ("bank account", entries[i].label);
            EXPECT_EQ(19u, entries[i].length);
        } else {
            EXPECT_EQ(pii, entries[i].id);
            EXPECT_FALSE(entries[i].hashed);
        }
    }
}

TEST_F(TaintRegistryTest, Mark_LongValuesAreHashOnly) {
    RegistryConfig cfg;
    cfg.literal_max_length = 8;
    cfg.hash_credentials = false;
    TaintRegistry reg(cfg);
    ASSERT_TRUE(reg.begin_session("s").success);

    ASSERT_TRUE(reg.mark("s", "short-ok", TaintType::credential()).success);
    ASSERT_TRUE(reg.mark("s", "quite-a-long-value", TaintType::pii()).success);

    std::vector<TaintEntryInfo> entries = reg.list_entries("s");
    ASSERT_EQ(2u, entries.size());
    EXPECT_FALSE(entries[0].hashed);
    EXPECT_TRUE(entries[1].hashed);

    ScanResult r = reg.scan("s", "leak: quite-a-long-value");
    ASSERT_TRUE(r.success);
    ASSERT_EQ(1u, r.matches.size());
    EXPECT_EQ(entries[1].id, r.matches[0].entry_id);
    EXPECT_EQ(MatchConfidence::Exact, r.matches[0].confidence);
    EXPECT_EQ(6u, r.matches[0].start);
}

TEST_F(TaintRegistryTest, AmendLabel_MetadataOnly) {
    std::string id = mark_ok("jdoe@example.com", TaintType::pii(), "old");
    ASSERT_TRUE(registry_.amend_label("s1", id, "customer email").success);
    EXPECT_EQ("customer email", registry_.list_entries("s1")[0].label);
    EXPECT_EQ(1u, registry_.scan("s1", "jdoe@example.com").matches.size());

    MarkResult missing = registry_.amend_label("s1", "no-such-id", "x");
    EXPECT_EQ(LeakageError::UnknownEntry, missing.error);
}

// ============================================================================
// Scanning
// ============================================================================

TEST_F(TaintRegistryTest, Scan_ExactLiteral) {
    std::string id = mark_ok("jdoe@example.com", TaintType::pii());
    ScanResult r = registry_.scan("s1", "Contact jdoe@example.com for details");
    ASSERT_TRUE(r.success);
    ASSERT_EQ(1u, r.matches.size());
    EXPECT_EQ(id, r.matches[0].entry_id);
    EXPECT_EQ(TaintType::pii(), r.matches[0].type);
    EXPECT_EQ(8u, r.matches[0].start);
    EXPECT_EQ(24u, r.matches[0].end);
    EXPECT_EQ(MatchConfidence::Exact, r.matches[0].confidence);
}

TEST_F(TaintRegistryTest, Scan_NoMatchesOnCleanText) {
    mark_ok("jdoe@example.com", TaintType::pii());
    ScanResult r = registry_.scan("s1", "The weather is nice today.");
    ASSERT_TRUE(r.success);
    EXPECT_TRUE(r.matches.empty());
}

TEST_F(TaintRegistryTest, Scan_FuzzyCaseAndWhitespace) {
    std::string id = mark_ok("John Smith", TaintType::pii());
    ScanResult r = registry_.scan("s1", "JOHN   SMITH");
    ASSERT_TRUE(r.success);
    ASSERT_EQ(1u, r.matches.size());
    EXPECT_EQ(id, r.matches[0].entry_id);
    EXPECT_EQ(MatchConfidence::FuzzyNormalized, r.matches[0].confidence);
    EXPECT_EQ(0u, r.matches[0].start);
    EXPECT_EQ(12u, r.matches[0].end);
}

TEST_F(TaintRegistryTest, Scan_ExactShadowsFuzzyOnSameBytes) {
    mark_ok("John Smith", TaintType::pii());
    ScanResult r = registry_.scan("s1", "john smith and John Smith");
    ASSERT_TRUE(r.success);
    ASSERT_EQ(2u, r.matches.size());
    EXPECT_EQ(0u, r.matches[0].start);
    EXPECT_EQ(MatchConfidence::FuzzyNormalized, r.matches[0].confidence);
    EXPECT_EQ(15u, r.matches[1].start);
    EXPECT_EQ(MatchConfidence::Exact, r.matches[1].confidence);
}

TEST_F(TaintRegistryTest, Scan_HashedCredentialFoundByWindow) {
    std::string id = mark_ok("acct-555-TOP-SECRET", TaintType::credential());
    ScanResult r = registry_.scan("s1", "account acct-555-TOP-SECRET here");
    ASSERT_TRUE(r.success);
    ASSERT_EQ(1u, r.matches.size());
    EXPECT_EQ(id, r.matches[0].entry_id);
    EXPECT_EQ(MatchConfidence::Exact, r.matches[0].confidence);
    EXPECT_EQ(8u, r.matches[0].start);
    EXPECT_EQ(27u, r.matches[0].end);
}

TEST_F(TaintRegistryTest, Scan_HashedCredentialFuzzy) {
    std::string id = mark_ok("acct-555-TOP-SECRET", TaintType::credential());
    ScanResult r = registry_.scan("s1", "ACCT-555-top-secret");
    ASSERT_TRUE(r.success);
    ASSERT_EQ(1u, r.matches.size());
    EXPECT_EQ(id, r.matches[0].entry_id);
    EXPECT_EQ(MatchConfidence::FuzzyNormalized, r.matches[0].confidence);
}

TEST_F(TaintRegistryTest, Scan_Base64Variant) {
    std::string id = mark_ok("jdoe@example.com", TaintType::pii());
    ScanResult r = registry_.scan("s1", "payload: amRvZUBleGFtcGxlLmNvbQ== done");
    ASSERT_TRUE(r.success);
    ASSERT_EQ(1u, r.matches.size());
    EXPECT_EQ(id, r.matches[0].entry_id);
    EXPECT_EQ(MatchConfidence::DecodedVariant, r.matches[0].confidence);
    EXPECT_EQ("base64", r.matches[0].encoding);
    EXPECT_EQ(9u, r.matches[0].start);
    EXPECT_EQ(33u, r.matches[0].end);
}

TEST_F(TaintRegistryTest, Scan_HexAndPercentVariants) {
    mark_ok("jdoe@example.com", TaintType::pii());

    ScanResult hex = registry_.scan("s1", "6a646f65406578616d706c652e636f6d");
    ASSERT_TRUE(hex.success);
    ASSERT_FALSE(hex.matches.empty());
    EXPECT_EQ(MatchConfidence::DecodedVariant, hex.matches[0].confidence);

    ScanResult pct = registry_.scan("s1", "mailto:jdoe%40example.com");
    ASSERT_TRUE(pct.success);
    ASSERT_EQ(1u, pct.matches.size());
    EXPECT_EQ("percent", pct.matches[0].encoding);
}

TEST_F(TaintRegistryTest, Scan_DoubleEncodedChain) {
    mark_ok("jdoe@example.com", TaintType::pii());
    ScanResult r = registry_.scan("s1", "x YW1SdlpVQmxlR0Z0Y0d4bExtTnZiUT09 y");
    ASSERT_TRUE(r.success);
    ASSERT_EQ(1u, r.matches.size());
    EXPECT_EQ("base64>base64", r.matches[0].encoding);
    EXPECT_EQ(2u, r.matches[0].start);
    EXPECT_EQ(34u, r.matches[0].end);
}

TEST_F(TaintRegistryTest, Scan_EncodedHashedCredential) {
    std::string id = mark_ok("acct-555-TOP-SECRET", TaintType::credential());
    ScanResult r = registry_.scan("s1", "data=YWNjdC01NTUtVE9QLVNFQ1JFVA==");
    ASSERT_TRUE(r.success);
    ASSERT_EQ(1u, r.matches.size());
    EXPECT_EQ(id, r.matches[0].entry_id);
    EXPECT_EQ(MatchConfidence::DecodedVariant, r.matches[0].confidence);
}

TEST_F(TaintRegistryTest, Scan_MalformedEncodingsNeverFail) {
    mark_ok("jdoe@example.com", TaintType::pii());
    ScanResult r = registry_.scan("s1", "bad%zz escape\\ &#xZZZZ; ====");
    ASSERT_TRUE(r.success);
    EXPECT_TRUE(r.matches.empty());
}

TEST_F(TaintRegistryTest, Scan_CanaryIsAlwaysTracked) {
    CanaryToken token;
    ASSERT_TRUE(registry_.canary_for("s1", token));
    ScanResult r = registry_.scan("s1", "the marker is " + token.token);
    ASSERT_TRUE(r.success);
    ASSERT_FALSE(r.matches.empty());
    EXPECT_EQ(TaintRegistry::CANARY_ENTRY_ID, r.matches[0].entry_id);
    EXPECT_EQ(TaintType::system_prompt_canary(), r.matches[0].type);
    EXPECT_EQ(14u, r.matches[0].start);
}

TEST_F(TaintRegistryTest, Scan_SortedByOffset) {
    std::string alpha = mark_ok("alpha-one", TaintType::pii());
    std::string beta = mark_ok("beta-two", TaintType::pii());
    ScanResult r = registry_.scan("s1", "beta-two then alpha-one");
    ASSERT_TRUE(r.success);
    ASSERT_EQ(2u, r.matches.size());
    EXPECT_EQ(beta, r.matches[0].entry_id);
    EXPECT_EQ(alpha, r.matches[1].entry_id);
}

TEST_F(TaintRegistryTest, Scan_SessionsAreIsolated) {
    mark_ok("jdoe@example.com", TaintType::pii());
    ASSERT_TRUE(registry_.begin_session("other").success);

    ScanResult r = registry_.scan("other", "Contact jdoe@example.com");
    ASSERT_TRUE(r.success);
    EXPECT_TRUE(r.matches.empty());
}

// ============================================================================
// Revocation
// ============================================================================

TEST_F(TaintRegistryTest, Revoke_IdempotentAndWipes) {
    mark_ok("jdoe@example.com", TaintType::pii());
    mark_ok("acct-555-TOP-SECRET", TaintType::credential());

    RevokeResult first = registry_.revoke_session("s1");
    EXPECT_TRUE(first.success);
    EXPECT_TRUE(first.existed);
    EXPECT_EQ(2u, first.entries_wiped);
    EXPECT_EQ(1u, first.canary_wiped);

    RevokeResult second = registry_.revoke_session("s1");
    EXPECT_TRUE(second.success);
    EXPECT_FALSE(second.existed);
    EXPECT_EQ(0u, second.entries_wiped);
    EXPECT_EQ(0u, second.canary_wiped);

    EXPECT_FALSE(registry_.has_session("s1"));
    ScanResult r = registry_.scan("s1", "jdoe@example.com");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(LeakageError::InvalidSession, r.error);
    EXPECT_TRUE(registry_.list_entries("s1").empty());
}

TEST_F(TaintRegistryTest, Revoke_UnknownSessionIsNoop) {
    RevokeResult r = registry_.revoke_session("never-started");
    EXPECT_TRUE(r.success);
    EXPECT_FALSE(r.existed);
}

TEST_F(TaintRegistryTest, Revoke_ConcurrentScansSeeAllOrNothing) {
    std::string a = mark_ok("jdoe@example.com", TaintType::pii());
    std::string b = mark_ok("acct-555-TOP-SECRET", TaintType::credential());
    const std::string text = "jdoe@example.com / acct-555-TOP-SECRET";

    std::atomic<int> partial(0);
    std::atomic<int> completed(0);
    std::vector<std::thread> readers;
    for (int t = 0; t < 4; ++t) {
        readers.push_back(std::thread([&]() {
            for (;;) {
                ScanResult r = registry_.scan("s1", text);
                if (!r.success) break;
                std::vector<std::string> ids = unique_entry_ids(r.matches);
                if (ids.size() != 2) partial.fetch_add(1);
                completed.fetch_add(1);
            }
        }));
    }

    while (completed.load() < 20) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    registry_.revoke_session("s1");
    for (size_t i = 0; i < readers.size(); ++i) {
        readers[i].join();
    }

    EXPECT_EQ(0, partial.load());
    EXPECT_NE(a, b);
}

// ============================================================================
// Normalization
// ============================================================================

TEST(NormalizeForMatchTest, CollapsesAndTracksOffsets) {
    std::vector<size_t> offsets;
    std::string out = normalize_for_match("A  B\tc", &offsets);
    EXPECT_EQ("a b c", out);
    ASSERT_EQ(5u, offsets.size());
    EXPECT_EQ(0u, offsets[0]);
    EXPECT_EQ(1u, offsets[1]);
    EXPECT_EQ(3u, offsets[2]);
    EXPECT_EQ(4u, offsets[3]);
    EXPECT_EQ(5u, offsets[4]);
}
