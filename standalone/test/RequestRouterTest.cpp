#include "Errors.hpp"
#include "JsonCodec.hpp"
#include "RequestRouter.hpp"
#include "TestSupport.hpp"
#include <gtest/gtest.h>
#include <future>

using namespace CropAdvisor;

namespace {

Json::Value sampleJson(const RawSample& r){
    Json::Value v(Json::objectValue);
    for(const auto& f : kRawFields) v[f.name] = r.*(f.member);
    return v;
}

Json::Value parse(const std::string& line){
    Json::Value v;
    std::string errors;
    EXPECT_TRUE(parseJson(line, v, errors)) << errors;
    return v;
}

}  // namespace

class RequestRouterTest : public ::testing::Test {
protected:
    RequestRouterTest()
    : store(TestSupport::constantSnapshot("cotton", "v1", 0.9)),
      retrainer(store, [this](const std::string&, const std::string& version, RetrainOrchestrator::Deadline){
          gate.wait();
          return TestSupport::constantModel("rice", version, 0.95);
      }),
      facade(store, retrainer, "data/Crop_recommendation.csv"),
      router(facade) {}

    ~RequestRouterTest() override {
        if(!released) release.set_value();
        retrainer.wait();
    }

    void open(){
        released = true;
        release.set_value();
    }

    Json::Value predictBody(const RawSample& r) const { return sampleJson(r); }

    std::promise<void> release;
    std::shared_future<void> gate{release.get_future().share()};
    bool released{false};
    ModelStore store;
    RetrainOrchestrator retrainer;
    ServiceFacade facade;
    RequestRouter router;
};

TEST_F(RequestRouterTest, RootAndHealth){
    const RouterResponse root = router.route("root", Json::Value());
    EXPECT_EQ(root.status, 200);
    EXPECT_EQ(root.payload["body"]["message"].asString(), "Crop Recommendation API");
    EXPECT_EQ(root.payload["body"]["version"].asString(), "1.0.0");

    const RouterResponse health = router.route("health", Json::Value());
    EXPECT_EQ(health.status, 200);
    EXPECT_EQ(health.payload["body"]["status"].asString(), "healthy");
    EXPECT_TRUE(health.payload["body"]["model_loaded"].asBool());
    EXPECT_FALSE(health.payload["body"]["timestamp"].asString().empty());
}

TEST_F(RequestRouterTest, Predict){
    const RouterResponse r = router.route("predict", predictBody(TestSupport::validSample()));
    ASSERT_EQ(r.status, 200);
    const Json::Value& body = r.payload["body"];
    EXPECT_EQ(body["predicted_crop"].asString(), "cotton");
    EXPECT_DOUBLE_EQ(body["confidence"].asDouble(), 1.0);
    EXPECT_EQ(body["all_probabilities"].size(), kCropCount);
    EXPECT_EQ(router.predictionsServed(), 1u);
}

TEST_F(RequestRouterTest, ValidationIs400){
    RawSample bad = TestSupport::validSample();
    bad.N = -10;
    const RouterResponse r = router.route("predict", predictBody(bad));
    EXPECT_EQ(r.status, 400);
    EXPECT_EQ(r.payload["error"]["type"].asString(), "ValidationError");
    EXPECT_EQ(r.payload["error"]["field"].asString(), "N");

    Json::Value missing = predictBody(TestSupport::validSample());
    missing.removeMember("rainfall");
    const RouterResponse m = router.route("predict", missing);
    EXPECT_EQ(m.status, 400);
    EXPECT_EQ(m.payload["error"]["field"].asString(), "rainfall");

    Json::Value text = predictBody(TestSupport::validSample());
    text["ph"] = "acidic";
    EXPECT_EQ(router.route("predict", text).status, 400);
    EXPECT_EQ(router.requestErrors(), 3u);
}

TEST_F(RequestRouterTest, BatchResults){
    Json::Value body(Json::objectValue);
    Json::Value items(Json::arrayValue);
    for(int i=0;i<4;++i) items.append(predictBody(TestSupport::validSample()));
    items[2]["humidity"] = 120;
    items[3] = "not an object";
    body["predictions"] = items;
    const RouterResponse r = router.route("predict_batch", body);
    ASSERT_EQ(r.status, 200);
    const Json::Value& out = r.payload["body"];
    EXPECT_EQ(out["total_predictions"].asUInt(), 4u);
    EXPECT_EQ(out["succeeded"].asUInt(), 2u);
    EXPECT_EQ(out["failed"].asUInt(), 2u);
    EXPECT_TRUE(out["predictions"][0]["ok"].asBool());
    EXPECT_EQ(out["predictions"][2]["error"]["field"].asString(), "humidity");
    EXPECT_EQ(out["predictions"][3]["index"].asUInt(), 3u);
    EXPECT_FALSE(out["predictions"][3]["ok"].asBool());
}

TEST_F(RequestRouterTest, OversizedBatchIs400){
    Json::Value body(Json::objectValue);
    Json::Value items(Json::arrayValue);
    for(int i=0;i<101;++i) items.append(predictBody(TestSupport::validSample()));
    body["predictions"] = items;
    const RouterResponse r = router.route("predict_batch", body);
    EXPECT_EQ(r.status, 400);
    EXPECT_EQ(r.payload["error"]["type"].asString(), "BatchTooLargeError");
    EXPECT_EQ(router.predictionsServed(), 0u);
}

TEST_F(RequestRouterTest, ModelInfoAndImportance){
    const RouterResponse info = router.route("model_info", Json::Value());
    ASSERT_EQ(info.status, 200);
    EXPECT_EQ(info.payload["body"]["model_name"].asString(), "Random Forest Classifier");
    EXPECT_EQ(info.payload["body"]["feature_count"].asUInt(), kFeatureCount);
    EXPECT_EQ(info.payload["body"]["class_count"].asUInt(), kCropCount);
    EXPECT_DOUBLE_EQ(info.payload["body"]["metrics"]["test_accuracy"].asDouble(), 0.9);

    const RouterResponse imp = router.route("feature_importance", Json::Value());
    ASSERT_EQ(imp.status, 200);
    EXPECT_EQ(imp.payload["body"]["ranking"][0]["feature"].asString(), "rainfall");
    EXPECT_EQ(imp.payload["body"]["ranking"][1]["feature"].asString(), "humidity");
    EXPECT_DOUBLE_EQ(imp.payload["body"]["feature_importance"]["rainfall"].asDouble(), 0.4);
}

TEST_F(RequestRouterTest, ImportanceUnsupportedIs404){
    store.publish(TestSupport::constantSnapshot("cotton", "v2", 0.9, false));
    const RouterResponse r = router.route("feature_importance", Json::Value());
    EXPECT_EQ(r.status, 404);
    EXPECT_EQ(r.payload["error"]["type"].asString(), "NotAvailableError");
}

TEST_F(RequestRouterTest, RetrainAcceptedThenConflict){
    Json::Value body(Json::objectValue);
    body["data_path"] = "crops.csv";
    const RouterResponse accepted = router.route("retrain", body);
    ASSERT_EQ(accepted.status, 202);
    EXPECT_TRUE(accepted.payload["body"]["accepted"].asBool());
    const unsigned id = accepted.payload["body"]["job_id"].asUInt();

    const RouterResponse busy = router.route("retrain", body);
    EXPECT_EQ(busy.status, 409);
    EXPECT_EQ(busy.payload["error"]["type"].asString(), "RetrainInProgressError");

    open();
    retrainer.wait();
    Json::Value query(Json::objectValue);
    query["job_id"] = id;
    const RouterResponse status = router.route("retrain_status", query);
    ASSERT_EQ(status.status, 200);
    EXPECT_EQ(status.payload["body"]["data_path"].asString(), "crops.csv");
    EXPECT_TRUE(status.payload["body"]["published"].asBool());
    EXPECT_EQ(status.payload["body"]["state"].asString(), "idle");
    const Json::Value& recall = status.payload["body"]["metrics"]["class_recall"];
    EXPECT_DOUBLE_EQ(recall["rice"].asDouble(), 1.0);
    EXPECT_DOUBLE_EQ(recall["apple"].asDouble(), 0.0);
    EXPECT_DOUBLE_EQ(router.route("model_info", Json::Value()).payload["body"]["metrics"]["class_recall"]["rice"].asDouble(), 1.0);
}

TEST_F(RequestRouterTest, RetrainStatusUnknownIs404){
    Json::Value query(Json::objectValue);
    query["job_id"] = 99;
    EXPECT_EQ(router.route("retrain_status", query).status, 404);
    EXPECT_EQ(router.route("retrain_status", Json::Value()).status, 404);
}

TEST_F(RequestRouterTest, NoModelIs503){
    store.publish(nullptr);
    EXPECT_EQ(router.route("predict", predictBody(TestSupport::validSample())).status, 503);
    EXPECT_EQ(router.route("model_info", Json::Value()).status, 503);
    const RouterResponse health = router.route("health", Json::Value());
    EXPECT_EQ(health.status, 200);
    EXPECT_EQ(health.payload["body"]["status"].asString(), "unhealthy");
    EXPECT_EQ(health.payload["body"]["message"].asString(), "Model not loaded");
}

TEST_F(RequestRouterTest, LineProtocol){
    const Json::Value ok = parse(router.handleLine(
        R"({"id": 7, "op": "predict", "body": {"N": 50, "P": 50, "K": 50, "temperature": 25, "humidity": 70, "ph": 6.5, "rainfall": 120}})"));
    EXPECT_EQ(ok["status"].asInt(), 200);
    EXPECT_EQ(ok["id"].asInt(), 7);
    EXPECT_EQ(ok["body"]["predicted_crop"].asString(), "cotton");

    EXPECT_EQ(parse(router.handleLine("{not json"))["status"].asInt(), 400);
    EXPECT_EQ(parse(router.handleLine(R"({"body": {}})"))["status"].asInt(), 400);
    const Json::Value unknown = parse(router.handleLine(R"({"op": "dance"})"));
    EXPECT_EQ(unknown["status"].asInt(), 400);
    EXPECT_EQ(unknown["error"]["field"].asString(), "op");
}
