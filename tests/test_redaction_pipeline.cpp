#include "RedactionPipeline.h"
#include "VeilExceptions.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

namespace {
const std::string kBlock = "\xE2\x96\x88";
const std::string kContact = "Contact: john@example.com or 555-123-4567";

std::string repeat(const std::string& s, size_t n) {
    std::string out;
    for (size_t i = 0; i < n; ++i) out += s;
    return out;
}

std::string readAll(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

class RedactionPipelineFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = std::filesystem::temp_directory_path() / (std::string("veil_pipeline_") + info->name());
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_ / "in");
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::string write(const std::string& relative, const std::string& content) {
        const auto path = dir_ / "in" / relative;
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary);
        out << content;
        return path.string();
    }

    RunConfig configFor(std::vector<std::string> inputs) const {
        RunConfig config;
        config.inputPaths = std::move(inputs);
        config.outputDir = (dir_ / "out").string();
        return config;
    }

    std::filesystem::path out(const std::string& name) const { return dir_ / "out" / name; }

    std::filesystem::path dir_;
};
} // namespace

TEST(RedactionPipelineTest, ProcessTextComputesDocumentStatistics) {
    const RedactionPipeline pipeline;
    const DocumentResult result = pipeline.processText(kContact, "memo.txt");

    EXPECT_EQ(result.name, "memo.txt");
    EXPECT_EQ(result.originalText, kContact);
    EXPECT_EQ(result.piiEntitiesFound, 2u);
    EXPECT_EQ(result.originalLength, 41u);
    EXPECT_EQ(result.redactedLength, 41u);
    EXPECT_EQ(result.charactersRedacted, 28u);
    EXPECT_GE(result.processingSeconds, 0.0);
    EXPECT_EQ(result.redactedText, "Contact: " + repeat(kBlock, 16) + " or " + repeat(kBlock, 12));

    ASSERT_EQ(result.countsByType.size(), 2u);
    EXPECT_EQ(result.countsByType.at("email"), 1u);
    EXPECT_EQ(result.countsByType.at("phone"), 1u);
}

TEST(RedactionPipelineTest, MarkerOverrideApplies) {
    const RedactionPipeline pipeline;
    const DocumentResult result = pipeline.processText(kContact, "memo", "*");
    EXPECT_EQ(result.redactedText, "Contact: **************** or ************");
}

TEST(RedactionPipelineTest, LengthsAreCountedInCodePoints) {
    const std::string text = "R\xC3\xA9sum\xC3\xA9 of Jane Doe";
    const DocumentResult result = RedactionPipeline().processText(text, "cv");
    ASSERT_EQ(result.piiEntitiesFound, 1u);
    EXPECT_EQ(result.entities[0].text, "Jane Doe");
    EXPECT_EQ(result.originalLength, 18u);
    EXPECT_EQ(result.redactedLength, 18u);
    EXPECT_EQ(result.charactersRedacted, 8u);
}

TEST(RedactionPipelineTest, DetailedReportListsEntities) {
    const DocumentResult result = RedactionPipeline().processText(kContact, "memo.txt");
    EXPECT_EQ(result.report,
              "PII Detection and Redaction Report\n"
              "=====================================\n"
              "\n"
              "File: memo.txt\n"
              "PII entities found: 2\n"
              "Characters redacted: 28\n"
              "\n"
              "Detected PII Entities:\n"
              "---------------------\n"
              "1. Type: email\n"
              "   Text: john@example.com\n"
              "   Confidence: 0.80\n"
              "   Position: 9-25\n"
              "\n"
              "2. Type: phone\n"
              "   Text: 555-123-4567\n"
              "   Confidence: 0.80\n"
              "   Position: 29-41\n"
              "\n");
}

TEST(RedactionPipelineTest, DetailedReportForCleanDocument) {
    const DocumentResult result = RedactionPipeline().processText("hello world", "clean.txt");
    EXPECT_EQ(result.piiEntitiesFound, 0u);
    EXPECT_EQ(result.redactedText, "hello world");
    EXPECT_EQ(result.report,
              "PII Detection and Redaction Report\n"
              "=====================================\n"
              "\n"
              "File: clean.txt\n"
              "PII entities found: 0\n"
              "Characters redacted: 0\n"
              "\n"
              "No PII entities detected.\n");
}

TEST(RedactionPipelineTest, EmptyTextIsHandled) {
    const DocumentResult result = RedactionPipeline().processText("", "empty");
    EXPECT_EQ(result.piiEntitiesFound, 0u);
    EXPECT_EQ(result.originalLength, 0u);
    EXPECT_EQ(result.redactedText, "");
}

TEST(RedactionPipelineTest, MarkdownReportHasEntityTable) {
    const DocumentResult result = RedactionPipeline().processText(kContact, "memo.txt");
    const std::string markdown = RedactionPipeline::buildMarkdownReport(result).markdown();
    EXPECT_NE(markdown.find("# PII Redaction Report: memo.txt"), std::string::npos);
    EXPECT_NE(markdown.find("## Entities by Type"), std::string::npos);
    EXPECT_NE(markdown.find("| 1 | email | john@example.com | 0.80 | 9 | 25 |"), std::string::npos);
    EXPECT_NE(markdown.find("| 2 | phone | 555-123-4567 | 0.80 | 29 | 41 |"), std::string::npos);
}

TEST(RedactionPipelineTest, OptionsFollowRunConfig) {
    RunConfig config;
    config.marker = "#";
    config.delimiter = ';';
    config.overlapStrategy = "best_confidence";
    config.lineOffsets = "cumulative";
    config.contextualOffsets = "exact";
    config.excludedTypes = {"zip_code"};
    const PipelineOptions options = PipelineOptions::fromConfig(config);
    EXPECT_EQ(options.marker, "#");
    EXPECT_EQ(options.acquisition.delimiter, ';');
    EXPECT_EQ(options.detector.overlapStrategy, OverlapStrategy::BEST_CONFIDENCE);
    EXPECT_EQ(options.detector.lineOffsets, LineOffsetMode::CUMULATIVE);
    EXPECT_EQ(options.detector.contextualOffsets, ContextualOffsetMode::EXACT);
    ASSERT_EQ(options.detector.excludedTypes.size(), 1u);

    EXPECT_EQ(PipelineOptions::fromConfig(RunConfig{}).detector.contextualOffsets, ContextualOffsetMode::ANCHORED);
}

TEST(RedactionPipelineTest, OutputStemStopsAtFirstDot) {
    EXPECT_EQ(RedactionPipeline::outputStem("dir/report.final.txt"), "report");
    EXPECT_EQ(RedactionPipeline::outputStem("notes"), "notes");
    EXPECT_EQ(RedactionPipeline::outputStem(".hidden"), "document");
}

TEST_F(RedactionPipelineFileTest, ProcessFileUsesFileNameAndAcquisition) {
    const std::string path = write("contact.json", R"({"email":"ann@example.com"})");
    const DocumentResult result = RedactionPipeline().processFile(path);
    EXPECT_EQ(result.name, "contact.json");
    EXPECT_EQ(result.originalText, "{\n  \"email\": \"ann@example.com\"\n}");
    ASSERT_EQ(result.countsByType.count("email"), 1u);
}

TEST_F(RedactionPipelineFileTest, ProcessFileWrapsAcquisitionFailures) {
    try {
        RedactionPipeline().processFile((dir_ / "in" / "missing.txt").string());
        FAIL() << "expected an acquisition error";
    } catch (const Veil::AcquisitionException& e) {
        const std::string message = e.what();
        EXPECT_EQ(message.rfind("Acquisition Error: Error processing document: Failed to read file: ", 0), 0u)
            << message;
        EXPECT_EQ(message.find("Acquisition Error:", 1), std::string::npos) << message;
    }
}

TEST_F(RedactionPipelineFileTest, RunWritesRedactedTextAndReports) {
    const std::string memo = write("memo.txt", kContact);
    const std::string table = write("people.csv", "name,phone\nAnn,555-123-4567\n");
    RunConfig config = configFor({memo, table});
    config.marker = "*";
    config.reportFormat = "both";

    EXPECT_EQ(RedactionPipeline::run(config), 0);
    EXPECT_EQ(readAll(out("memo_redacted.txt")), "Contact: **************** or ************");
    EXPECT_EQ(readAll(out("people_redacted.txt")), "name phone\nAnn ************\n");
    EXPECT_NE(readAll(out("memo_report.txt")).find("PII entities found: 2"), std::string::npos);
    EXPECT_TRUE(std::filesystem::exists(out("memo_report.md")));
    EXPECT_TRUE(std::filesystem::exists(out("people_report.md")));
}

TEST_F(RedactionPipelineFileTest, RunWithoutReportsWritesOnlyRedactedText) {
    RunConfig config = configFor({write("memo.txt", kContact)});
    config.reportFormat = "none";
    EXPECT_EQ(RedactionPipeline::run(config), 0);
    EXPECT_TRUE(std::filesystem::exists(out("memo_redacted.txt")));
    EXPECT_FALSE(std::filesystem::exists(out("memo_report.txt")));
    EXPECT_FALSE(std::filesystem::exists(out("memo_report.md")));
}

TEST_F(RedactionPipelineFileTest, RunReportsFailureButFinishesOtherDocuments) {
    const std::string good = write("good.txt", kContact);
    const std::string missing = (dir_ / "in" / "missing.txt").string();
    EXPECT_EQ(RedactionPipeline::run(configFor({missing, good})), 1);
    EXPECT_TRUE(std::filesystem::exists(out("good_redacted.txt")));
    EXPECT_FALSE(std::filesystem::exists(out("missing_redacted.txt")));
}

TEST_F(RedactionPipelineFileTest, RunKeepsOutputsOfSameNamedInputsApart) {
    const std::string first = write("a/notes.txt", "first");
    const std::string second = write("b/notes.txt", "second");
    EXPECT_EQ(RedactionPipeline::run(configFor({first, second})), 0);
    EXPECT_EQ(readAll(out("notes_redacted.txt")), "first");
    EXPECT_EQ(readAll(out("notes_2_redacted.txt")), "second");
}
