#include "Errors.hpp"
#include "ModelStore.hpp"
#include "Predictor.hpp"
#include "TestSupport.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <utility>

using namespace CropAdvisor;
namespace fs = std::filesystem;

namespace {

std::string loadError(const std::string& dir){
    try {
        ModelStore::loadArtifacts(dir);
    } catch(const ModelLoadError& e){
        return e.what();
    }
    return std::string();
}

void replaceInFile(const std::string& path, const std::string& from, const std::string& to){
    std::string text = TestSupport::readFile(path);
    const auto at = text.find(from);
    ASSERT_NE(at, std::string::npos) << from;
    text.replace(at, from.size(), to);
    TestSupport::writeFile(path, text);
}

}  // namespace

TEST(ModelStore, EmptyUntilPublished){
    ModelStore store;
    EXPECT_FALSE(store.loaded());
    EXPECT_EQ(store.current(), nullptr);
    store.publish(TestSupport::constantSnapshot("maize", "v1"));
    EXPECT_TRUE(store.loaded());
    EXPECT_EQ(store.current()->version, "v1");
}

TEST(ModelStore, HeldSnapshotSurvivesPublish){
    ModelStore store(TestSupport::constantSnapshot("maize", "v1"));
    const SnapshotPtr held = store.current();
    store.publish(TestSupport::constantSnapshot("rice", "v2"));
    EXPECT_EQ(held->version, "v1");
    EXPECT_EQ(Predictor::predict(TestSupport::validSample(), *held).predictedCrop, "maize");
    EXPECT_EQ(store.current()->version, "v2");
}

TEST(ModelStore, SaveThenLoadRoundTrip){
    TestSupport::ScratchDir dir("store");
    const SnapshotPtr snap = TestSupport::constantSnapshot("lentil", "v7", 0.91);
    ModelStore::saveArtifacts(dir.path(), *snap);
    EXPECT_TRUE(fs::exists(ModelStore::artifactPath(dir.path(), kForestArtifact)));
    EXPECT_TRUE(fs::exists(ModelStore::artifactPath(dir.path(), kTransformArtifact)));
    EXPECT_TRUE(fs::exists(ModelStore::artifactPath(dir.path(), kMetricsArtifact)));
    EXPECT_FALSE(fs::exists(dir.file(".staging-v7")));

    const SnapshotPtr back = ModelStore::loadArtifacts(dir.path());
    EXPECT_EQ(back->version, "v7");
    EXPECT_EQ(back->labels, snap->labels);
    EXPECT_DOUBLE_EQ(back->metrics.testAccuracy, 0.91);
    EXPECT_EQ(back->metrics.trainedAt, snap->metrics.trainedAt);
    EXPECT_EQ(back->forest.importances(), snap->forest.importances());
}

TEST(ModelStore, TrainedSnapshotPredictsIdenticallyAfterReload){
    TestSupport::ScratchDir dir("trained");
    const SnapshotPtr snap = TestSupport::trainedSnapshot();
    ModelStore::saveArtifacts(dir.path(), *snap);
    const SnapshotPtr back = ModelStore::loadArtifacts(dir.path());
    EXPECT_FALSE(back->metrics.classRecall.empty());
    EXPECT_EQ(back->metrics.classRecall, snap->metrics.classRecall);
    for(const auto& s : TestSupport::syntheticDataset(3, 1234)){
        const PredictionResult a = Predictor::predict(s.raw, *snap);
        const PredictionResult b = Predictor::predict(s.raw, *back);
        EXPECT_EQ(a.predictedCrop, b.predictedCrop);
        EXPECT_EQ(a.allProbabilities, b.allProbabilities);
    }
}

TEST(ModelStore, MissingArtifactNamesFileNotPath){
    TestSupport::ScratchDir dir("missing");
    ModelStore::saveArtifacts(dir.path(), *TestSupport::constantSnapshot("maize", "v1"));
    fs::remove(ModelStore::artifactPath(dir.path(), kTransformArtifact));
    const std::string msg = loadError(dir.path());
    EXPECT_NE(msg.find(kTransformArtifact), std::string::npos);
    EXPECT_EQ(msg.find(dir.path()), std::string::npos);
}

TEST(ModelStore, MixedSnapshotVersionsRejected){
    TestSupport::ScratchDir a("mixed_a"), b("mixed_b");
    ModelStore::saveArtifacts(a.path(), *TestSupport::constantSnapshot("maize", "v1"));
    ModelStore::saveArtifacts(b.path(), *TestSupport::constantSnapshot("maize", "v2"));
    fs::copy_file(ModelStore::artifactPath(b.path(), kMetricsArtifact),
                  ModelStore::artifactPath(a.path(), kMetricsArtifact), fs::copy_options::overwrite_existing);
    const std::string msg = loadError(a.path());
    EXPECT_NE(msg.find("different snapshots"), std::string::npos) << msg;
}

TEST(ModelStore, LabelMismatchRejected){
    TestSupport::ScratchDir dir("labels");
    ModelStore::saveArtifacts(dir.path(), *TestSupport::constantSnapshot("maize", "v1"));
    replaceInFile(ModelStore::artifactPath(dir.path(), kForestArtifact), "labels apple banana", "labels banana apple");
    EXPECT_NE(loadError(dir.path()).find("label set"), std::string::npos);
}

TEST(ModelStore, ThresholdSkewRejected){
    TestSupport::ScratchDir dir("skew");
    ModelStore::saveArtifacts(dir.path(), *TestSupport::constantSnapshot("maize", "v1"));
    replaceInFile(ModelStore::artifactPath(dir.path(), kTransformArtifact), "ph_bounds 5.5 7.5", "ph_bounds 6 7.5");
    EXPECT_NE(loadError(dir.path()).find(kTransformArtifact), std::string::npos);
}

TEST(ModelStore, MalformedForestRejected){
    TestSupport::ScratchDir dir("malformed");
    ModelStore::saveArtifacts(dir.path(), *TestSupport::constantSnapshot("maize", "v1"));
    TestSupport::writeFile(ModelStore::artifactPath(dir.path(), kForestArtifact), "snapshot v1\nlabels apple\nforest 1 1\n");
    EXPECT_FALSE(loadError(dir.path()).empty());

    TestSupport::writeFile(ModelStore::artifactPath(dir.path(), kForestArtifact), "forest 1 22 13\n");
    EXPECT_NE(loadError(dir.path()).find("snapshot header"), std::string::npos);
}

TEST(ModelStore, EmptyDirectoryRejected){
    TestSupport::ScratchDir dir("empty");
    EXPECT_THROW(ModelStore::loadArtifacts(dir.path()), ModelLoadError);
}

TEST(ModelStore, OversizedForestCountsRejected){
    TestSupport::ScratchDir dir("oversized");
    ModelStore::saveArtifacts(dir.path(), *TestSupport::constantSnapshot("maize", "v1"));
    const std::string forest = ModelStore::artifactPath(dir.path(), kForestArtifact);
    const std::string saved = TestSupport::readFile(forest);
    const std::pair<std::string, std::string> edits[] = {
        {"forest 1 22 13", "forest 1 4000000000000000000 13"},
        {"forest 1 22 13", "forest 1 22 4000000000000000000"},
        {"forest 1 22 13", "forest 4000000000000000000 22 13"},
        {"tree 1\n", "tree 2000000000\n"},
    };
    for(const auto& edit : edits){
        std::string text = saved;
        const auto at = text.find(edit.first);
        ASSERT_NE(at, std::string::npos) << edit.first;
        text.replace(at, edit.first.size(), edit.second);
        TestSupport::writeFile(forest, text);
        EXPECT_THROW(ModelStore::loadArtifacts(dir.path()), ModelLoadError) << edit.second;
    }
}

TEST(ModelStore, SaveSwitchesAllArtifactsTogether){
    TestSupport::ScratchDir dir("switch");
    ModelStore::saveArtifacts(dir.path(), *TestSupport::constantSnapshot("maize", "v1"));
    ModelStore::saveArtifacts(dir.path(), *TestSupport::constantSnapshot("rice", "v2"));
    EXPECT_EQ(ModelStore::loadArtifacts(dir.path())->version, "v2");
    EXPECT_TRUE(fs::is_symlink(dir.file("current")));
    EXPECT_TRUE(fs::exists(dir.file("snapshot-v2")));
    EXPECT_FALSE(fs::exists(dir.file("snapshot-v1")));

    // an interrupted save leaves the linked snapshot untouched
    fs::create_directories(dir.file(".staging-v3"));
    TestSupport::writeFile(dir.file(".staging-v3/forest.model"), "snapshot v3\n");
    EXPECT_EQ(ModelStore::loadArtifacts(dir.path())->version, "v2");
}

TEST(ModelStore, ResavingAVersionKeepsItLoadable){
    TestSupport::ScratchDir dir("resave");
    const SnapshotPtr snap = TestSupport::constantSnapshot("maize", "v1");
    ModelStore::saveArtifacts(dir.path(), *snap);
    ModelStore::saveArtifacts(dir.path(), *snap);
    EXPECT_EQ(ModelStore::loadArtifacts(dir.path())->version, "v1");
    EXPECT_FALSE(fs::exists(dir.file("snapshot-v1")));
    EXPECT_TRUE(fs::exists(dir.file("snapshot-v1-1")));
}

TEST(ModelStore, LoadsFlatArtifactDirectory){
    TestSupport::ScratchDir saved("flat_src"), flat("flat");
    ModelStore::saveArtifacts(saved.path(), *TestSupport::constantSnapshot("maize", "v4"));
    for(const char* name : {kForestArtifact, kTransformArtifact, kMetricsArtifact}){
        fs::copy_file(ModelStore::artifactPath(saved.path(), name), flat.file(name));
    }
    EXPECT_EQ(ModelStore::artifactPath(flat.path(), kForestArtifact), flat.file(kForestArtifact));
    EXPECT_EQ(ModelStore::loadArtifacts(flat.path())->version, "v4");
}
