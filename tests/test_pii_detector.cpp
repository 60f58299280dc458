#include "PiiDetector.h"
#include "RedactionRenderer.h"
#include "VeilExceptions.h"

#include <gtest/gtest.h>

namespace {
const std::string kContact = "Contact: john@example.com or 555-123-4567";

const std::string kRecord =
    "Patient ID: AB-1234\n"
    "John Smith lives at 42 Main Street, Springfield, IL 62704.\n"
    "SSN: 123-45-6789, card 4111111111111111, email a.b@example.com\n"
    "Born March 3, 1980 in Canada. Salary $85,000.00 at Acme Corp.";
} // namespace

TEST(PiiDetectorTest, ContactLineYieldsEmailAndPhone) {
    const PiiDetector detector;
    const auto entities = detector.detectAll(kContact);
    ASSERT_EQ(entities.size(), 2u);

    EXPECT_EQ(entities[0].entityType, "email");
    EXPECT_EQ(entities[0].text, "john@example.com");
    EXPECT_EQ(entities[0].startPos, 9u);
    EXPECT_EQ(entities[0].endPos, 25u);

    EXPECT_EQ(entities[1].entityType, "phone");
    EXPECT_EQ(entities[1].text, "555-123-4567");
    EXPECT_EQ(entities[1].startPos, 29u);
    EXPECT_EQ(entities[1].endPos, 41u);

    const std::string redacted = RedactionRenderer::redact(kContact, entities, '*');
    EXPECT_EQ(redacted, "Contact: **************** or ************");
}

TEST(PiiDetectorTest, StructuralSsnBeatsKeywordCapture) {
    const PiiDetector detector;
    const auto entities = detector.detectAll("SSN: 123-45-6789");
    ASSERT_EQ(entities.size(), 1u);
    EXPECT_EQ(entities[0].entityType, "ssn");
    EXPECT_EQ(entities[0].startPos, 5u);
    EXPECT_EQ(entities[0].endPos, 16u);
    EXPECT_DOUBLE_EQ(entities[0].confidence, 0.8);
}

TEST(PiiDetectorTest, DenylistedPhraseAloneIsClean) {
    EXPECT_TRUE(PiiDetector().detectAll("Main Street").empty());
}

TEST(PiiDetectorTest, EmptyTextHasNoEntities) {
    EXPECT_TRUE(PiiDetector().detectAll("").empty());
}

TEST(PiiDetectorTest, DetectionIsDeterministic) {
    const PiiDetector detector;
    EXPECT_EQ(detector.detectAll(kRecord), detector.detectAll(kRecord));
    EXPECT_EQ(detector.detectAll(kRecord), PiiDetector().detectAll(kRecord));
}

TEST(PiiDetectorTest, ResolvedEntitiesAreDisjointAndMatchTheirSpans) {
    for (const auto strategy : {OverlapStrategy::FIRST_CONFLICT, OverlapStrategy::BEST_CONFIDENCE}) {
        DetectorOptions options;
        options.overlapStrategy = strategy;
        options.contextualOffsets = ContextualOffsetMode::EXACT;
        const auto entities = PiiDetector(options).detectAll(kRecord);
        ASSERT_FALSE(entities.empty());

        for (size_t i = 0; i < entities.size(); ++i) {
            EXPECT_EQ(kRecord.substr(entities[i].startPos, entities[i].length()), entities[i].text);
            for (size_t j = i + 1; j < entities.size(); ++j) {
                EXPECT_FALSE(OverlapResolver::overlaps(entities[i], entities[j]));
            }
        }
    }
}

TEST(PiiDetectorTest, AnchoredKeywordSpanStartsOneByteIntoTheSeparator) {
    const auto entities = PiiDetector().detectAll(kRecord);
    ASSERT_FALSE(entities.empty());
    EXPECT_EQ(entities[0].entityType, "contextual_pii");
    EXPECT_EQ(entities[0].text, "AB-1234");
    EXPECT_EQ(entities[0].startPos, 11u);
    EXPECT_EQ(entities[0].endPos, 18u);

    for (size_t i = 0; i < entities.size(); ++i) {
        EXPECT_LE(entities[i].endPos, kRecord.size());
        if (entities[i].entityType != "contextual_pii") {
            EXPECT_EQ(kRecord.substr(entities[i].startPos, entities[i].length()), entities[i].text);
        }
        for (size_t j = i + 1; j < entities.size(); ++j) {
            EXPECT_FALSE(OverlapResolver::overlaps(entities[i], entities[j]));
        }
    }
}

TEST(PiiDetectorTest, SingleByteMarkerPreservesLength) {
    const PiiDetector detector;
    const auto entities = detector.detectAll(kRecord);
    EXPECT_EQ(RedactionRenderer::redact(kRecord, entities, '#').size(), kRecord.size());
}

TEST(PiiDetectorTest, ExcludedTypesAreNeverReported) {
    DetectorOptions options;
    options.excludedTypes = {"email"};
    const auto entities = PiiDetector(options).detectAll(kContact);
    ASSERT_EQ(entities.size(), 1u);
    EXPECT_EQ(entities[0].entityType, "phone");
}

TEST(PiiDetectorTest, UnknownExcludedTypeThrows) {
    DetectorOptions options;
    options.excludedTypes = {"not_a_type"};
    EXPECT_THROW(PiiDetector{options}, Veil::ConfigurationException);
}

TEST(PiiDetectorTest, LongRunsCompleteWithoutCrashing) {
    std::string words = "1 ";
    for (int i = 0; i < 40000; ++i) words += "ab ";
    words += "Street";

    const std::vector<std::string> inputs = {
        words,
        "Xx" + std::string(100000, 'a'),
        "$" + std::string(100000, '1'),
        std::string(120000, ' ') + "John Smith",
    };
    const PiiDetector detector;
    for (const auto& text : inputs) {
        ASSERT_GE(text.size(), 100000u);
        std::vector<PiiEntity> entities;
        EXPECT_NO_THROW(entities = detector.detectAll(text));
        for (size_t i = 0; i + 1 < entities.size(); ++i) {
            EXPECT_LE(entities[i].endPos, entities[i + 1].startPos);
        }
        EXPECT_EQ(RedactionRenderer::redact(text, entities, '#').size(), text.size());
    }
}

TEST(PiiDetectorTest, MatchesFarIntoLargeTextKeepAbsoluteOffsets) {
    std::string text;
    for (int i = 0; i < 5000; ++i) text += "plain filler words here. ";
    const size_t emailAt = text.size();
    text += "reach me at jane@example.org please";

    const auto entities = PiiDetector().detectAll(text);
    ASSERT_EQ(entities.size(), 1u);
    EXPECT_EQ(entities[0].entityType, "email");
    EXPECT_EQ(entities[0].startPos, emailAt + 12);
    EXPECT_EQ(text.substr(entities[0].startPos, entities[0].length()), "jane@example.org");
}
