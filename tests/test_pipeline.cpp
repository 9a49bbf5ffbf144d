#include "ztredact/errors.h"
#include "ztredact/pipeline.h"
#include "ztredact/text_util.h"

#include "test_support.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <set>
#include <thread>

using namespace ztredact;
using namespace ztredact::test_support;
using S = ProcessingState;

namespace {
const std::string kScenario = "Herr Max Mustermann, geboren am 01.01.1980, wohnhaft in Berlin";
const std::string kScenarioSanitized = "Herr [PERSON_1], geboren am [DATE_1], wohnhaft in [LOCATION_1]";
const std::string kDenseDates =
    "Termine am 01.02.2020, am 03.04.2021, am 05.06.2022, am 07.08.2023, am 09.10.2024.";

Document text_doc(const std::string &text, const std::string &id = "letter.txt") {
    Document d;
    d.id = id;
    d.text = text;
    return d;
}

Document scanned_doc(int pages) {
    Document d;
    d.id = "scan.png";
    for (int i = 0; i < pages; ++i) d.pages.push_back(cv::Mat(300, 200, CV_8UC3, cv::Scalar::all(255)));
    return d;
}

PipelineConfig test_config() {
    PipelineConfig cfg;
    cfg.threads = 2;
    cfg.log.console = false;
    return cfg;
}

bool contains(const std::vector<std::string> &v, const std::string &s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

class PipelineTest : public ::testing::Test {
protected:
    PipelineTest() : logger(test_config().log) {
        services.image_analyzer = std::make_shared<FakeImageAnalyzer>(std::vector<DetectedRegion>{});
        services.analysis = analysis;
    }

    Pipeline make_pipeline() { return Pipeline(cfg, logger, services); }

    PipelineConfig cfg = test_config();
    SecureLogger logger;
    std::shared_ptr<FakeAnalysisClient> analysis = std::make_shared<FakeAnalysisClient>();
    PipelineServices services;
};
} // namespace

TEST_F(PipelineTest, ScenarioIsReleasedWithPlaceholders) {
    Pipeline p = make_pipeline();
    ProcessingRecord rec = p.process(text_doc(kScenario));

    EXPECT_TRUE(rec.sealed());
    EXPECT_EQ(rec.outcome(), S::RELEASED);
    ASSERT_TRUE(rec.sanitized_text().has_value());
    EXPECT_EQ(*rec.sanitized_text(), kScenarioSanitized);

    ASSERT_TRUE(rec.risk().has_value());
    EXPECT_EQ(rec.risk()->score, 35);
    EXPECT_EQ(rec.risk()->decision, TriageDecision::ENHANCED_LOGGING);

    std::vector<S> expected = {S::RECEIVED, S::VISUAL_SANITIZED, S::EXTRACTED, S::DETECTED, S::CONSOLIDATED,
                               S::SCORED, S::RELEASED, S::SEALED};
    EXPECT_EQ(rec.history(), expected);
    EXPECT_TRUE(rec.detector_failures().empty());

    // downstream analysis only ever sees sanitized text
    ASSERT_EQ(analysis->seen.size(), 1u);
    EXPECT_EQ(analysis->seen[0], kScenarioSanitized);
    EXPECT_FALSE(rec.analysis().is_null());
    EXPECT_TRUE(rec.analysis_error().empty());
}

TEST_F(PipelineTest, SameInputSamePlanAndScore) {
    Pipeline p = make_pipeline();
    ProcessingRecord a = p.process(text_doc(kScenario));
    ProcessingRecord b = p.process(text_doc(kScenario));
    ASSERT_TRUE(a.plan() && b.plan());
    EXPECT_TRUE(*a.plan() == *b.plan());
    EXPECT_EQ(a.risk()->score, b.risk()->score);
    EXPECT_EQ(*a.sanitized_text(), *b.sanitized_text());
    EXPECT_NE(a.id(), b.id());
}

TEST_F(PipelineTest, DenseDocumentIsHeldUntilApproved) {
    Pipeline p = make_pipeline();
    ProcessingRecord held = p.process(text_doc(kDenseDates));

    EXPECT_TRUE(held.sealed());
    EXPECT_EQ(held.outcome(), S::HELD_FOR_REVIEW);
    EXPECT_FALSE(held.sanitized_text().has_value());
    ASSERT_TRUE(held.risk().has_value());
    EXPECT_EQ(held.risk()->decision, TriageDecision::HUMAN_REVIEW_REQUIRED);
    EXPECT_TRUE(contains(p.pending_reviews(), held.id()));
    EXPECT_TRUE(analysis->seen.empty());

    ProcessingRecord approved = p.review_decision(held.id(), ReviewDecision::APPROVE);
    EXPECT_EQ(approved.id(), held.id());
    EXPECT_EQ(approved.outcome(), S::RELEASED);
    ASSERT_TRUE(approved.sanitized_text().has_value());
    EXPECT_EQ(*approved.sanitized_text(),
              "Termine am [DATE_1], am [DATE_2], am [DATE_3], am [DATE_4], am [DATE_5].");
    EXPECT_TRUE(p.pending_reviews().empty());
    EXPECT_EQ(analysis->seen.size(), 1u);

    EXPECT_THROW(p.review_decision(held.id(), ReviewDecision::APPROVE), UnknownProcessingId);
}

TEST_F(PipelineTest, RejectedReviewReleasesNothing) {
    Pipeline p = make_pipeline();
    ProcessingRecord held = p.process(text_doc(kDenseDates));
    ProcessingRecord rejected = p.review_decision(held.id(), ReviewDecision::REJECT);
    EXPECT_EQ(rejected.outcome(), S::REVIEW_REJECTED);
    EXPECT_FALSE(rejected.sanitized_text().has_value());
    EXPECT_TRUE(rejected.sealed());
    EXPECT_TRUE(p.pending_reviews().empty());
    EXPECT_TRUE(analysis->seen.empty());
}

TEST_F(PipelineTest, HeldDocumentSurvivesRestart) {
    std::filesystem::path dir = std::filesystem::temp_directory_path() / "ztredact_test_review_store";
    std::filesystem::remove_all(dir);
    cfg.review.store_dir = dir.string();

    std::string id;
    {
        Pipeline first = make_pipeline();
        ProcessingRecord held = first.process(text_doc(kDenseDates));
        ASSERT_EQ(held.outcome(), S::HELD_FOR_REVIEW);
        id = held.id();
    }
    EXPECT_TRUE(std::filesystem::exists(dir / (id + ".json")));

    Pipeline second = make_pipeline();
    EXPECT_TRUE(contains(second.pending_reviews(), id));
    ProcessingRecord approved = second.review_decision(id, ReviewDecision::APPROVE);
    EXPECT_EQ(approved.outcome(), S::RELEASED);
    EXPECT_TRUE(approved.sealed());
    ASSERT_TRUE(approved.sanitized_text().has_value());
    EXPECT_EQ(*approved.sanitized_text(),
              "Termine am [DATE_1], am [DATE_2], am [DATE_3], am [DATE_4], am [DATE_5].");
    ASSERT_TRUE(approved.risk().has_value());
    EXPECT_EQ(approved.risk()->decision, TriageDecision::HUMAN_REVIEW_REQUIRED);
    EXPECT_EQ(approved.plan()->entries.size(), 5u);
    EXPECT_EQ(analysis->seen.size(), 1u);

    EXPECT_FALSE(std::filesystem::exists(dir / (id + ".json")));
    EXPECT_TRUE(second.pending_reviews().empty());
    EXPECT_THROW(second.review_decision(id, ReviewDecision::APPROVE), UnknownProcessingId);
    std::filesystem::remove_all(dir);
}

TEST_F(PipelineTest, StoredEntryHoldsNoRawValues) {
    std::filesystem::path dir = std::filesystem::temp_directory_path() / "ztredact_test_review_raw";
    std::filesystem::remove_all(dir);
    cfg.review.store_dir = dir.string();
    // a single person/location pair held by policy
    cfg.risk.auto_release_max = 0;
    cfg.risk.enhanced_logging_max = 0;

    Pipeline p = make_pipeline();
    ProcessingRecord held = p.process(text_doc(kScenario));
    ASSERT_EQ(held.outcome(), S::HELD_FOR_REVIEW);
    std::ifstream entry(dir / (held.id() + ".json"), std::ios::binary);
    ASSERT_TRUE(entry.good());
    std::string content((std::istreambuf_iterator<char>(entry)), std::istreambuf_iterator<char>());
    EXPECT_NE(content.find(kScenarioSanitized), std::string::npos);
    EXPECT_EQ(content.find("Mustermann"), std::string::npos);
    EXPECT_EQ(content.find("Berlin"), std::string::npos);

    ProcessingRecord rejected = p.review_decision(held.id(), ReviewDecision::REJECT);
    EXPECT_EQ(rejected.outcome(), S::REVIEW_REJECTED);
    EXPECT_TRUE(p.pending_reviews().empty());
    std::filesystem::remove_all(dir);
}

TEST_F(PipelineTest, UnknownReviewIdThrows) {
    Pipeline p = make_pipeline();
    EXPECT_THROW(p.review_decision("0000000000000000", ReviewDecision::APPROVE), UnknownProcessingId);
}

TEST_F(PipelineTest, ReturnedRecordIsSealed) {
    Pipeline p = make_pipeline();
    ProcessingRecord rec = p.process(text_doc(kScenario));
    EXPECT_THROW(rec.add_timing("late", 1.0), std::logic_error);
    ProcessingRecord held = p.process(text_doc(kDenseDates));
    EXPECT_THROW(held.transition(S::RELEASED), std::logic_error);
}

TEST_F(PipelineTest, NoTextIsRejected) {
    Pipeline p = make_pipeline();
    Document empty;
    empty.id = "empty.pdf";
    ProcessingRecord rec = p.process(empty);
    EXPECT_EQ(rec.outcome(), S::REJECTED);
    EXPECT_FALSE(rec.error().empty());
    EXPECT_FALSE(rec.plan().has_value());
    EXPECT_FALSE(rec.sanitized_text().has_value());
}

TEST_F(PipelineTest, BlankOcrIsRejected) {
    services.extractor = std::make_shared<FakeExtractor>("  \n ");
    Pipeline p = make_pipeline();
    ProcessingRecord rec = p.process(scanned_doc(1));
    EXPECT_EQ(rec.outcome(), S::REJECTED);
    EXPECT_FALSE(rec.sanitized_text().has_value());
}

TEST_F(PipelineTest, OcrEngineFailureIsRejected) {
    auto extractor = std::make_shared<FakeExtractor>(kScenario);
    extractor->fail = true;
    services.extractor = extractor;
    Pipeline p = make_pipeline();
    ProcessingRecord rec = p.process(scanned_doc(2));
    EXPECT_EQ(rec.outcome(), S::REJECTED);
    EXPECT_NE(rec.error().find("tesseract"), std::string::npos);
}

TEST_F(PipelineTest, ScannedPagesAreRedactedAndScored) {
    services.extractor = std::make_shared<FakeExtractor>(kScenario);
    services.image_analyzer = std::make_shared<FakeImageAnalyzer>(std::vector<DetectedRegion>{
        {cv::Rect(20, 20, 40, 40), EntityKind::FACE, 0.9}});
    Pipeline p = make_pipeline();
    ProcessingRecord rec = p.process(scanned_doc(1));

    EXPECT_EQ(rec.outcome(), S::RELEASED);
    EXPECT_EQ(rec.page_count(), 1);
    ASSERT_TRUE(rec.plan().has_value());
    ASSERT_EQ(rec.plan()->regions.size(), 1u);
    EXPECT_EQ(rec.plan()->regions[0].kind, EntityKind::FACE);
    EXPECT_EQ(rec.risk()->score, 40);
    EXPECT_EQ(kind_counts(*rec.plan())["FACE"], 1);
    EXPECT_EQ(*rec.sanitized_text(), kScenarioSanitized + "\n");
}

TEST_F(PipelineTest, TextLayerInsideStampIsDropped) {
    services.image_analyzer = std::make_shared<FakeImageAnalyzer>(std::vector<DetectedRegion>{
        {cv::Rect(100, 180, 90, 60), EntityKind::STAMP, 0.8}});
    Pipeline p = make_pipeline();

    Document doc = scanned_doc(1);
    doc.id = "bescheid.pdf";
    doc.text_layer = {
        {"Herr", {0, 10, 10, 30, 12}, true},
        {"Max", {0, 45, 10, 25, 12}, true},
        {"Mustermann", {0, 75, 10, 70, 12}, false},
        {"Siegel", {0, 105, 200, 30, 12}, true},
        {"Amtsgericht", {0, 140, 200, 45, 12}, false},
        {"Musterstadt", {0, 110, 215, 60, 12}, false},
    };
    ProcessingRecord rec = p.process(doc);

    ASSERT_EQ(rec.outcome(), S::RELEASED);
    ASSERT_EQ(rec.plan()->regions.size(), 1u);
    EXPECT_EQ(*rec.sanitized_text(), "Herr [PERSON_1]\n");
}

TEST(LayerText, KeepsLinesAndSpacing) {
    std::vector<LayerWord> words = {
        {"Sehr", {0, 10, 10, 30, 12}, true},
        {"geehrte", {0, 45, 10, 50, 12}, false},
        {"Damen", {0, 10, 30, 40, 12}, true},
        {"Seite", {1, 10, 10, 40, 12}, false},
    };
    EXPECT_EQ(layer_text_outside(words, {}), "Sehr geehrte\nDamen\nSeite\n");

    Findings regions = {Finding::region({0, 40, 5, 60, 20}, EntityKind::SIGNATURE, 0.7)};
    EXPECT_EQ(layer_text_outside(words, regions), "Sehr\nDamen\nSeite\n");
}

TEST_F(PipelineTest, UnpositionedTextWithRegionsIsOcrOnly) {
    services.extractor = std::make_shared<FakeExtractor>(kScenario);
    services.image_analyzer = std::make_shared<FakeImageAnalyzer>(std::vector<DetectedRegion>{
        {cv::Rect(20, 20, 40, 40), EntityKind::SIGNATURE, 0.7}});
    Pipeline p = make_pipeline();

    Document doc = scanned_doc(1);
    doc.text = "Unterschrift Dr. Amtsgericht Musterstadt";
    ProcessingRecord rec = p.process(doc);
    ASSERT_EQ(rec.outcome(), S::RELEASED);
    EXPECT_EQ(*rec.sanitized_text(), kScenarioSanitized + "\n");
}

TEST_F(PipelineTest, VisualFailureBlanksPageAndContinues) {
    auto analyzer = std::make_shared<FakeImageAnalyzer>(std::vector<DetectedRegion>{});
    analyzer->fail = true;
    services.image_analyzer = analyzer;
    services.extractor = std::make_shared<FakeExtractor>(kScenario);
    Pipeline p = make_pipeline();
    ProcessingRecord rec = p.process(scanned_doc(1));

    EXPECT_EQ(rec.outcome(), S::RELEASED);
    ASSERT_EQ(rec.plan()->regions.size(), 1u);
    EXPECT_EQ(rec.plan()->regions[0].kind, EntityKind::IMAGE_REGION);
    EXPECT_EQ(rec.plan()->regions[0].box.width, 200);
    EXPECT_EQ(rec.plan()->regions[0].box.height, 300);
}

TEST_F(PipelineTest, CancelledBeforeStart) {
    Pipeline p = make_pipeline();
    CancellationToken token;
    token.cancel();
    ProcessingRecord rec = p.process(text_doc(kScenario), token);
    EXPECT_EQ(rec.outcome(), S::CANCELLED);
    EXPECT_FALSE(rec.plan().has_value());
    EXPECT_FALSE(rec.sanitized_text().has_value());
}

TEST_F(PipelineTest, CancelledDuringDetectionLeavesNoPlan) {
    CancellationToken token;
    auto recognizer = std::make_shared<FakeRecognizer>(std::vector<EntitySpan>{});
    recognizer->hook = [token]() mutable { token.cancel(); };
    services.recognizer = recognizer;
    Pipeline p = make_pipeline();

    ProcessingRecord rec = p.process(text_doc(kScenario), token);
    EXPECT_EQ(recognizer->calls.load(), 1);
    EXPECT_EQ(rec.outcome(), S::CANCELLED);
    EXPECT_FALSE(rec.plan().has_value());
    EXPECT_FALSE(rec.risk().has_value());
    EXPECT_FALSE(rec.sanitized_text().has_value());
    EXPECT_TRUE(p.pending_reviews().empty());
}

TEST_F(PipelineTest, CancelAbandonsSlowModelCall) {
    CancellationToken token;
    auto recognizer = std::make_shared<FakeRecognizer>(std::vector<EntitySpan>{});
    recognizer->block_for = std::chrono::seconds(20);
    services.recognizer = recognizer;
    Pipeline p = make_pipeline();

    std::thread canceller([token]() mutable {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        token.cancel();
    });
    auto t0 = std::chrono::steady_clock::now();
    ProcessingRecord rec = p.process(text_doc(kScenario), token);
    auto elapsed = std::chrono::steady_clock::now() - t0;
    canceller.join();

    EXPECT_EQ(rec.outcome(), S::CANCELLED);
    EXPECT_LT(elapsed, std::chrono::seconds(5));
    EXPECT_TRUE(rec.detector_failures().empty());
    EXPECT_FALSE(rec.sanitized_text().has_value());
}

TEST_F(PipelineTest, FailingDetectorCountsAsZeroFindings) {
    auto recognizer = std::make_shared<FakeRecognizer>(std::vector<EntitySpan>{});
    recognizer->fail = true;
    services.recognizer = recognizer;
    Pipeline p = make_pipeline();

    ProcessingRecord rec = p.process(text_doc(kScenario));
    EXPECT_EQ(rec.outcome(), S::RELEASED);
    EXPECT_EQ(rec.detector_failures(), std::vector<std::string>{"statistical-ner"});
    EXPECT_EQ(*rec.sanitized_text(), kScenarioSanitized);
}

TEST_F(PipelineTest, StatisticalFindingsJoinThePlan) {
    // the NER model finds the second name, no trigger precedes it
    std::string text = kScenario + ". Anwalt Klaus Klever";
    size_t start = utf8_length(kScenario + ". Anwalt ");
    services.recognizer = std::make_shared<FakeRecognizer>(std::vector<EntitySpan>{
        {start, start + 12, "PER", 0.92}});
    // two person/location pairs would otherwise hold the document
    cfg.risk.auto_release_max = 100;
    cfg.risk.enhanced_logging_max = 100;
    Pipeline p = make_pipeline();

    ProcessingRecord rec = p.process(text_doc(text));
    ASSERT_TRUE(rec.sanitized_text().has_value());
    EXPECT_EQ(*rec.sanitized_text(), kScenarioSanitized + ". Anwalt [PERSON_2]");
}

TEST_F(PipelineTest, CaseGazetteerCatchesOcrTypos) {
    auto gazetteer = std::make_shared<Gazetteer>();
    gazetteer->add("Max Mustermann");
    Document doc = text_doc("Sehr geehrter Herr Max Musterman, vielen Dank.");
    doc.gazetteer = gazetteer;
    Pipeline p = make_pipeline();

    ProcessingRecord rec = p.process(doc);
    ASSERT_TRUE(rec.plan().has_value());
    ASSERT_EQ(rec.plan()->entries.size(), 1u);
    EXPECT_EQ(rec.plan()->entries[0].source, DetectorKind::FUZZY);
    EXPECT_EQ(*rec.sanitized_text(), "Sehr geehrter Herr [PERSON_1], vielen Dank.");
}

TEST_F(PipelineTest, AnalysisFailureKeepsRelease) {
    TempFile log_file("pipeline_analysis.log");
    LogConfig log_cfg;
    log_cfg.console = false;
    log_cfg.file_path = log_file.path();
    std::string content;
    {
        SecureLogger file_logger(log_cfg);
        analysis->fail_message = "upstream rejected request about Max Mustermann";
        Pipeline p(cfg, file_logger, services);

        ProcessingRecord rec = p.process(text_doc(kScenario));
        EXPECT_EQ(rec.outcome(), S::RELEASED);
        EXPECT_EQ(*rec.sanitized_text(), kScenarioSanitized);
        EXPECT_TRUE(rec.analysis().is_null());
        EXPECT_FALSE(rec.analysis_error().empty());
        EXPECT_EQ(rec.analysis_error().find("Mustermann"), std::string::npos);
        file_logger.flush();
    }
    content = log_file.read();
    EXPECT_NE(content.find("analysis failed"), std::string::npos);
    EXPECT_EQ(content.find("Mustermann"), std::string::npos);
}

TEST_F(PipelineTest, ConcurrentDocumentsAreIndependent) {
    Pipeline p = make_pipeline();
    const int n = 8;
    std::vector<ProcessingRecord> results;
    std::mutex mu;
    std::vector<std::thread> threads;
    for (int i = 0; i < n; ++i) {
        threads.emplace_back([&, i](){
            ProcessingRecord rec = p.process(text_doc(i % 2 ? kScenario : kDenseDates, "doc" + std::to_string(i)));
            std::lock_guard<std::mutex> lk(mu);
            results.push_back(std::move(rec));
        });
    }
    for (auto &t : threads) t.join();

    ASSERT_EQ(results.size(), (size_t)n);
    std::set<std::string> ids;
    int released = 0, held = 0;
    for (auto &r : results) {
        ids.insert(r.id());
        if (r.outcome() == S::RELEASED) {
            released++;
            EXPECT_EQ(*r.sanitized_text(), kScenarioSanitized);
        }
        if (r.outcome() == S::HELD_FOR_REVIEW) held++;
    }
    EXPECT_EQ(ids.size(), (size_t)n);
    EXPECT_EQ(released, n / 2);
    EXPECT_EQ(held, n / 2);
    EXPECT_EQ(p.pending_reviews().size(), (size_t)(n / 2));
}

TEST_F(PipelineTest, AuditJsonHasNoText) {
    Pipeline p = make_pipeline();
    ProcessingRecord rec = p.process(text_doc(kScenario));
    std::string dumped = rec.to_json().dump();
    EXPECT_EQ(dumped.find("Mustermann"), std::string::npos);
    EXPECT_EQ(dumped.find("Berlin"), std::string::npos);
    // placeholders appear in the redaction list, the sanitized text does not
    EXPECT_NE(dumped.find("[PERSON_1]"), std::string::npos);
    EXPECT_EQ(dumped.find(kScenarioSanitized), std::string::npos);
}
