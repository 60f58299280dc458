#include "CandidateExtractor.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <iterator>

namespace {
std::vector<PiiEntity> ofType(const std::vector<PiiEntity>& entities, const std::string& type) {
    std::vector<PiiEntity> out;
    std::copy_if(entities.begin(), entities.end(), std::back_inserter(out),
                 [&](const PiiEntity& e) { return e.entityType == type; });
    return out;
}

CandidateExtractor defaultExtractor(LineOffsetMode mode = LineOffsetMode::FIRST_OCCURRENCE,
                                    ContextualOffsetMode offsets = ContextualOffsetMode::ANCHORED) {
    return CandidateExtractor(PatternCatalog::defaults(), mode, offsets);
}
} // namespace

TEST(CandidateExtractorTest, StructuralPassReportsExactSpan) {
    const std::string text = "Email me at jane.doe@example.org today";
    const auto emails = ofType(defaultExtractor().structuralPass(text), "email");
    ASSERT_EQ(emails.size(), 1u);
    EXPECT_EQ(emails[0].text, "jane.doe@example.org");
    EXPECT_EQ(emails[0].startPos, 12u);
    EXPECT_EQ(emails[0].endPos, 32u);
    EXPECT_DOUBLE_EQ(emails[0].confidence, 0.8);
}

TEST(CandidateExtractorTest, HeuristicPassFindsCapitalisedNames) {
    const std::string text = "we met John Smith yesterday";
    const auto names = ofType(defaultExtractor().heuristicPass(text), "builtin_full_name");
    ASSERT_EQ(names.size(), 1u);
    EXPECT_EQ(names[0].text, "John Smith");
    EXPECT_EQ(names[0].startPos, 7u);
    EXPECT_EQ(names[0].endPos, 17u);
    EXPECT_DOUBLE_EQ(names[0].confidence, 0.7);
}

TEST(CandidateExtractorTest, HeuristicPassSkipsDenylistedPhrases) {
    EXPECT_TRUE(defaultExtractor().heuristicPass("Main Street").empty());
}

TEST(CandidateExtractorTest, HeuristicPassSkipsShortMatches) {
    const auto extractor = defaultExtractor();
    EXPECT_TRUE(ofType(extractor.heuristicPass("fee $5 paid"), "builtin_currency").empty());

    const auto currency = ofType(extractor.heuristicPass("fee $50 paid"), "builtin_currency");
    ASSERT_EQ(currency.size(), 1u);
    EXPECT_EQ(currency[0].text, "$50");
    EXPECT_EQ(currency[0].startPos, 4u);
}

TEST(CandidateExtractorTest, ContextualPassCapturesValueAfterKeyword) {
    const std::string text = "Patient ID: AB-1234";
    const auto found = defaultExtractor().contextualPass(text);
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].entityType, "contextual_pii");
    EXPECT_EQ(found[0].text, "AB-1234");
    // keyword end (10) + match offset in the trimmed tail (0) + 1
    EXPECT_EQ(found[0].startPos, 11u);
    EXPECT_EQ(found[0].endPos, 18u);
    EXPECT_DOUBLE_EQ(found[0].confidence, 0.6);
}

TEST(CandidateExtractorTest, ExactContextualOffsetsCoverTheCapture) {
    const std::string text = "Patient ID: AB-1234";
    const auto found = defaultExtractor(LineOffsetMode::FIRST_OCCURRENCE, ContextualOffsetMode::EXACT)
                           .contextualPass(text);
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].startPos, 12u);
    EXPECT_EQ(found[0].endPos, 19u);
    EXPECT_EQ(text.substr(found[0].startPos, found[0].length()), found[0].text);
}

TEST(CandidateExtractorTest, AnchoredOffsetNeverPassesTheExactOne) {
    const std::string text = "ref\nsocial security number :   987 65 4321 end";
    const auto anchored = defaultExtractor().contextualPass(text);
    const auto exact = defaultExtractor(LineOffsetMode::FIRST_OCCURRENCE, ContextualOffsetMode::EXACT)
                           .contextualPass(text);
    ASSERT_FALSE(anchored.empty());
    ASSERT_EQ(anchored.size(), exact.size());
    for (size_t i = 0; i < anchored.size(); ++i) {
        EXPECT_EQ(anchored[i].text, exact[i].text);
        EXPECT_LE(anchored[i].startPos, exact[i].startPos);
        EXPECT_LE(anchored[i].endPos, text.size());
        EXPECT_EQ(text.substr(exact[i].startPos, exact[i].length()), exact[i].text);
    }
}

TEST(CandidateExtractorTest, ContextualKeywordMatchIsCaseInsensitive) {
    const std::string text = "EMPLOYEE ID: ZX-99812";
    const auto found = defaultExtractor().contextualPass(text);
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].text, "ZX-99812");
    EXPECT_EQ(found[0].startPos, 12u);
}

TEST(CandidateExtractorTest, ContextualPassSkipsTwoCharacterValues) {
    EXPECT_TRUE(defaultExtractor().contextualPass("SSN: ab").empty());
}

TEST(CandidateExtractorTest, DuplicateLinesShareFirstOccurrenceOffset) {
    const std::string text = "Patient ID: AB-1234\nPatient ID: AB-1234";
    const auto found = defaultExtractor(LineOffsetMode::FIRST_OCCURRENCE).contextualPass(text);
    ASSERT_EQ(found.size(), 2u);
    EXPECT_EQ(found[0].startPos, 11u);
    EXPECT_EQ(found[1].startPos, 11u);
}

TEST(CandidateExtractorTest, CumulativeOffsetsTrackEachLine) {
    const std::string text = "Patient ID: AB-1234\nPatient ID: AB-1234";
    const auto found = defaultExtractor(LineOffsetMode::CUMULATIVE, ContextualOffsetMode::EXACT).contextualPass(text);
    ASSERT_EQ(found.size(), 2u);
    EXPECT_EQ(found[0].startPos, 12u);
    EXPECT_EQ(found[1].startPos, 32u);
    EXPECT_EQ(text.substr(found[1].startPos, found[1].length()), "AB-1234");
}

TEST(CandidateExtractorTest, ExtractAllKeepsPassOrder) {
    const auto all = defaultExtractor().extractAll("SSN: 123-45-6789");
    ASSERT_GE(all.size(), 2u);
    EXPECT_EQ(all.front().entityType, "ssn");
    EXPECT_EQ(all.back().entityType, "contextual_pii");
    EXPECT_EQ(all.front().startPos, 5u);
    EXPECT_EQ(all.back().startPos, 4u);
    EXPECT_EQ(all.back().endPos, 15u);
}

TEST(CandidateExtractorTest, ExcludedContextualTypeDisablesKeywordPass) {
    const CandidateExtractor extractor(PatternCatalog::defaults()->withoutTypes({"contextual_pii"}));
    EXPECT_TRUE(extractor.contextualPass("Patient ID: AB-1234").empty());
}

TEST(CandidateExtractorTest, LongSeparatorRunAfterKeywordCompletes) {
    const std::string text = "ssn" + std::string(200000, ':') + " 123";
    EXPECT_NO_THROW(defaultExtractor().contextualPass(text));
}
