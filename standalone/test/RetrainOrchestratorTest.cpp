#include "Errors.hpp"
#include "Predictor.hpp"
#include "RetrainOrchestrator.hpp"
#include "ServiceFacade.hpp"
#include "TestSupport.hpp"
#include <gtest/gtest.h>
#include <future>
#include <thread>

using namespace CropAdvisor;

namespace {

RetrainOrchestrator::TrainFunction returning(const std::string& crop, double accuracy){
    return [crop, accuracy](const std::string&, const std::string& version, RetrainOrchestrator::Deadline){
        return TestSupport::constantModel(crop, version, accuracy);
    };
}

}  // namespace

TEST(RetrainOrchestrator, SecondStartWhileTrainingIsRejected){
    ModelStore store(TestSupport::constantSnapshot("maize", "v1", 0.9));
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    std::promise<void> entered;
    RetrainOrchestrator retrainer(store, [&](const std::string&, const std::string& version, RetrainOrchestrator::Deadline){
        entered.set_value();
        gate.wait();
        return TestSupport::constantModel("rice", version, 0.95);
    });

    const std::uint32_t first = retrainer.start("a.csv");
    entered.get_future().wait();
    EXPECT_TRUE(retrainer.busy());
    EXPECT_EQ(retrainer.phase(), RetrainPhase::Training);
    try {
        retrainer.start("b.csv");
        ADD_FAILURE() << "second retrain was accepted";
    } catch(const RetrainInProgressError& e){
        EXPECT_EQ(e.activeJob(), first);
    }
    release.set_value();
    retrainer.wait();

    EXPECT_FALSE(retrainer.busy());
    EXPECT_EQ(retrainer.phase(), RetrainPhase::Idle);
    const auto job = retrainer.job(first);
    ASSERT_TRUE(job);
    EXPECT_TRUE(job->finished);
    EXPECT_TRUE(job->published);
    EXPECT_EQ(job->dataPath, "a.csv");
    EXPECT_EQ(store.current()->version, job->version);
}

TEST(RetrainOrchestrator, PublishIsVisibleOnTheNextCall){
    ModelStore store(TestSupport::constantSnapshot("maize", "v1", 0.9));
    RetrainOrchestrator retrainer(store, returning("rice", 0.97));
    ServiceFacade facade(store, retrainer, "default.csv");
    EXPECT_EQ(facade.predict(TestSupport::validSample()).predictedCrop, "maize");

    const RetrainTicket t = facade.retrain("");
    EXPECT_TRUE(t.accepted);
    retrainer.wait();

    const ModelInfo info = facade.modelInfo();
    EXPECT_DOUBLE_EQ(info.metrics.testAccuracy, 0.97);
    EXPECT_NE(info.modelVersion, "v1");
    EXPECT_EQ(facade.predict(TestSupport::validSample()).predictedCrop, "rice");

    const auto job = facade.retrainStatus(t.jobId);
    ASSERT_TRUE(job);
    EXPECT_EQ(job->dataPath, "default.csv");
    ASSERT_TRUE(job->metrics);
    EXPECT_DOUBLE_EQ(job->metrics->testAccuracy, 0.97);
}

TEST(RetrainOrchestrator, RegressionKeepsCurrentSnapshot){
    const SnapshotPtr before = TestSupport::constantSnapshot("maize", "v1", 0.95);
    ModelStore store(before);
    RetrainOrchestrator retrainer(store, returning("rice", 0.92));
    const std::uint32_t id = retrainer.start("a.csv");
    retrainer.wait();

    EXPECT_EQ(store.current(), before);
    const auto job = retrainer.job(id);
    ASSERT_TRUE(job);
    EXPECT_TRUE(job->finished);
    EXPECT_FALSE(job->published);
    EXPECT_EQ(job->phase, RetrainPhase::Failed);
    EXPECT_NE(job->message.find("keeping snapshot v1"), std::string::npos) << job->message;
}

TEST(RetrainOrchestrator, AbsoluteFloorAppliesWithoutAModel){
    ModelStore store;
    RetrainOrchestrator retrainer(store, returning("rice", 0.75));
    retrainer.start("a.csv");
    retrainer.wait();
    EXPECT_FALSE(store.loaded());
    EXPECT_FALSE(retrainer.latestJob()->published);
}

TEST(RetrainOrchestrator, SmallRegressionIsAccepted){
    ModelStore store(TestSupport::constantSnapshot("maize", "v1", 0.95));
    RetrainOrchestrator retrainer(store, returning("rice", 0.94));
    retrainer.start("a.csv");
    retrainer.wait();
    EXPECT_TRUE(retrainer.latestJob()->published);
    EXPECT_EQ(Predictor(store).predict(TestSupport::validSample()).predictedCrop, "rice");
}

TEST(RetrainOrchestrator, TrainerExceptionEndsFailed){
    const SnapshotPtr before = TestSupport::constantSnapshot("maize", "v1", 0.9);
    ModelStore store(before);
    RetrainOrchestrator retrainer(store, [](const std::string&, const std::string&, RetrainOrchestrator::Deadline) -> TrainedModel {
        throw TrainingFailedError("training dataset is missing or unreadable");
    });
    const std::uint32_t id = retrainer.start("nowhere.csv");
    retrainer.wait();
    const auto job = retrainer.job(id);
    ASSERT_TRUE(job);
    EXPECT_EQ(job->phase, RetrainPhase::Failed);
    EXPECT_NE(job->message.find("missing or unreadable"), std::string::npos);
    EXPECT_EQ(store.current(), before);
    EXPECT_FALSE(retrainer.busy());

    // the slot is free again
    EXPECT_NO_THROW(retrainer.start("again.csv"));
    retrainer.wait();
}

TEST(RetrainOrchestrator, TimeoutRejectsCandidate){
    ModelStore store(TestSupport::constantSnapshot("maize", "v1", 0.9));
    RetrainPolicy policy;
    policy.timeout = std::chrono::seconds(0);
    RetrainOrchestrator retrainer(store, [](const std::string&, const std::string& version, RetrainOrchestrator::Deadline){
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        return TestSupport::constantModel("rice", version, 0.99);
    }, policy);
    retrainer.start("a.csv");
    retrainer.wait();
    const auto job = retrainer.latestJob();
    EXPECT_FALSE(job->published);
    EXPECT_NE(job->message.find("time limit"), std::string::npos);
    EXPECT_EQ(store.current()->version, "v1");
}

TEST(RetrainOrchestrator, PublishedArtifactsAreSaved){
    TestSupport::ScratchDir dir("retrain");
    ModelStore store;
    RetrainPolicy policy;
    policy.artifactDir = dir.path();
    RetrainOrchestrator retrainer(store, returning("rice", 0.9), policy);
    retrainer.start("a.csv");
    retrainer.wait();
    ASSERT_TRUE(store.loaded());
    EXPECT_EQ(ModelStore::loadArtifacts(dir.path())->version, store.current()->version);
}

TEST(RetrainOrchestrator, TrainsFromCsv){
    TestSupport::ScratchDir dir("csv");
    TestSupport::writeCsv(dir.file("crops.csv"), TestSupport::syntheticDataset(60, 11));
    ModelStore store;
    RetrainOrchestrator retrainer(store, datasetTrainer(TestSupport::quickOptions(20)));
    const std::uint32_t id = retrainer.start(dir.file("crops.csv"));
    retrainer.wait();
    const auto job = retrainer.job(id);
    ASSERT_TRUE(job);
    EXPECT_TRUE(job->published) << job->message;
    ASSERT_TRUE(store.loaded());
    EXPECT_GE(store.current()->metrics.testAccuracy, 0.8);
}

TEST(RetrainOrchestrator, UnknownJobIsEmpty){
    ModelStore store;
    RetrainOrchestrator retrainer(store, returning("rice", 0.9));
    EXPECT_FALSE(retrainer.job(42));
    EXPECT_FALSE(retrainer.latestJob());
    EXPECT_STREQ(retrainPhaseName(retrainer.phase()), "idle");
}

TEST(RetrainOrchestrator, ValidationRescoresOnHeldOutRows){
    ModelStore store(TestSupport::constantSnapshot("maize", "v1", 0.9));
    // reports 0.99 but only half of its held-out rows are rice
    RetrainOrchestrator overclaiming(store, [](const std::string&, const std::string& version, RetrainOrchestrator::Deadline){
        return TrainedModel{TestSupport::constantSnapshot("rice", version, 0.99), TestSupport::holdoutFor("rice", 0.5)};
    });
    overclaiming.start("a.csv");
    overclaiming.wait();
    auto job = overclaiming.latestJob();
    ASSERT_TRUE(job);
    EXPECT_FALSE(job->published);
    EXPECT_NE(job->message.find("held-out accuracy 0.5 "), std::string::npos) << job->message;
    ASSERT_TRUE(job->metrics);
    EXPECT_DOUBLE_EQ(job->metrics->testAccuracy, 0.5);
    EXPECT_EQ(store.current()->version, "v1");

    RetrainOrchestrator underclaiming(store, [](const std::string&, const std::string& version, RetrainOrchestrator::Deadline){
        return TrainedModel{TestSupport::constantSnapshot("rice", version, 0.5), TestSupport::holdoutFor("rice", 0.96)};
    });
    underclaiming.start("a.csv");
    underclaiming.wait();
    job = underclaiming.latestJob();
    ASSERT_TRUE(job);
    EXPECT_TRUE(job->published) << job->message;
    const TrainingMetrics& m = store.current()->metrics;
    EXPECT_DOUBLE_EQ(m.testAccuracy, 0.96);
    EXPECT_EQ(m.testSamples, 100u);
    ASSERT_EQ(m.classRecall.size(), 2u);
    EXPECT_DOUBLE_EQ(m.classRecall.at("rice"), 1.0);
    EXPECT_DOUBLE_EQ(m.classRecall.at("apple"), 0.0);
}

TEST(RetrainOrchestrator, CandidateWithoutHeldOutRowsIsRejected){
    ModelStore store;
    RetrainOrchestrator retrainer(store, [](const std::string&, const std::string& version, RetrainOrchestrator::Deadline){
        return TrainedModel{TestSupport::constantSnapshot("rice", version, 0.99), {}};
    });
    retrainer.start("a.csv");
    retrainer.wait();
    const auto job = retrainer.latestJob();
    ASSERT_TRUE(job);
    EXPECT_FALSE(job->published);
    EXPECT_EQ(job->phase, RetrainPhase::Failed);
    EXPECT_NE(job->message.find("held-out"), std::string::npos);
    EXPECT_FALSE(store.loaded());
}
