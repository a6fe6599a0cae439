#include "Trainer.hpp"
#include "Errors.hpp"
#include "FeatureEngineer.hpp"
#include "Predictor.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <map>
#include <numeric>
#include <random>
#include <sstream>
#include <utility>

namespace CropAdvisor {

namespace {

void splitCsv(const std::string& line, std::vector<std::string>& out){
    out.clear();
    std::size_t start = 0;
    while(start <= line.size()){
        const auto comma = line.find(',', start);
        if(comma == std::string::npos){
            out.emplace_back(line.substr(start));
            break;
        }
        out.emplace_back(line.substr(start, comma - start));
        start = comma + 1;
    }
    for(auto& tok : out){
        const auto b = tok.find_first_not_of(" \t\r\"");
        const auto e = tok.find_last_not_of(" \t\r\"");
        tok = (b == std::string::npos) ? std::string() : tok.substr(b, e - b + 1);
    }
}

bool parseDouble(const std::string& token, double& out){
    if(token.empty()) return false;
    char* end = nullptr;
    out = std::strtod(token.c_str(), &end);
    return end == token.c_str() + token.size();
}

int labelIndex(const std::string& label){
    for(std::size_t i=0;i<kCropCount;++i){ if(label == kCropLabels[i]) return static_cast<int>(i); }
    return -1;
}

std::size_t argmax(const std::vector<double>& p){
    std::size_t best = 0;
    for(std::size_t i=1;i<p.size();++i){ if(p[i] > p[best]) best = i; }
    return best;
}

double accuracy(const Forest& forest, const std::vector<std::vector<double>>& X, const std::vector<int>& y){
    if(X.empty()) return 0.0;
    std::size_t hits = 0;
    for(std::size_t i=0;i<X.size();++i){
        if(static_cast<int>(argmax(forest.proba(X[i]))) == y[i]) ++hits;
    }
    return static_cast<double>(hits) / static_cast<double>(X.size());
}

}  // namespace

std::string utcTimestamp(){
    const std::time_t now = std::time(nullptr);
    std::tm tm{};
    gmtime_r(&now, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::vector<LabeledSample> loadDataset(const std::string& csvPath){
    std::ifstream in(csvPath);
    if(!in) throw TrainingFailedError("training dataset is missing or unreadable");

    std::string line;
    if(!std::getline(in, line)) throw TrainingFailedError("training dataset is empty");
    std::vector<std::string> tokens;
    splitCsv(line, tokens);

    std::array<int, kRawFieldCount> column;
    column.fill(-1);
    int labelColumn = -1;
    for(std::size_t c=0;c<tokens.size();++c){
        if(tokens[c] == "label"){ labelColumn = static_cast<int>(c); continue; }
        for(std::size_t f=0;f<kRawFieldCount;++f){ if(tokens[c] == kRawFields[f].name) column[f] = static_cast<int>(c); }
    }
    for(std::size_t f=0;f<kRawFieldCount;++f){
        if(column[f] < 0) throw TrainingFailedError(std::string("training dataset has no ") + kRawFields[f].name + " column");
    }
    if(labelColumn < 0) throw TrainingFailedError("training dataset has no label column");

    std::vector<LabeledSample> samples;
    std::size_t lineNo = 1;
    while(std::getline(in, line)){
        ++lineNo;
        if(line.find_first_not_of(" \t\r") == std::string::npos) continue;
        splitCsv(line, tokens);
        const std::string where = "training dataset line " + std::to_string(lineNo);
        LabeledSample s;
        for(std::size_t f=0;f<kRawFieldCount;++f){
            const std::size_t c = static_cast<std::size_t>(column[f]);
            if(c >= tokens.size() || !parseDouble(tokens[c], s.raw.*(kRawFields[f].member))){
                throw TrainingFailedError(where + ": " + kRawFields[f].name + " is not a number");
            }
        }
        const std::size_t lc = static_cast<std::size_t>(labelColumn);
        if(lc >= tokens.size() || tokens[lc].empty()) throw TrainingFailedError(where + ": label is missing");
        s.label = tokens[lc];
        try {
            validate(s.raw);
        } catch(const ValidationError& e){
            throw TrainingFailedError(where + ": " + e.what());
        }
        samples.push_back(std::move(s));
    }
    if(samples.empty()) throw TrainingFailedError("training dataset has no samples");
    return samples;
}

TrainedModel trainModel(const std::vector<LabeledSample>& samples, const TrainerOptions& options,
                        const std::string& version, std::chrono::steady_clock::time_point deadline){
    std::vector<int> y(samples.size());
    std::array<std::size_t, kCropCount> perClass{};
    for(std::size_t i=0;i<samples.size();++i){
        y[i] = labelIndex(samples[i].label);
        if(y[i] < 0) throw TrainingFailedError("label '" + samples[i].label + "' is not a supported crop");
        ++perClass[y[i]];
    }
    for(std::size_t c=0;c<kCropCount;++c){
        if(perClass[c] == 0) throw TrainingFailedError(std::string("training dataset has no samples of ") + kCropLabels[c]);
    }
    if(!(options.testFraction > 0.0 && options.testFraction < 1.0)) throw TrainingFailedError("test fraction must be within (0, 1)");

    std::vector<std::size_t> order(samples.size());
    std::iota(order.begin(), order.end(), 0);
    std::mt19937 rng(options.seed);
    std::shuffle(order.begin(), order.end(), rng);
    const std::size_t nTest = static_cast<std::size_t>(std::ceil(options.testFraction * static_cast<double>(samples.size())));
    if(nTest == 0 || nTest >= samples.size()) throw TrainingFailedError("training dataset is too small to split");

    std::vector<EngineeredFeatureVector> trainRows;
    std::vector<int> yTrain;
    std::vector<LabeledSample> holdout;
    for(std::size_t k=0;k<order.size();++k){
        const std::size_t i = order[k];
        if(k < nTest){ holdout.push_back(samples[i]); }
        else { trainRows.push_back(engineer(samples[i].raw)); yTrain.push_back(y[i]); }
    }

    auto snap = std::make_shared<ModelSnapshot>();
    snap->version = version;
    for(const char* l : kCropLabels) snap->labels.emplace_back(l);
    snap->transform.fit(trainRows);

    std::vector<std::vector<double>> XTrain;
    XTrain.reserve(trainRows.size());
    for(const auto& r : trainRows) XTrain.push_back(snap->transform.apply(r));

    snap->forest = Forest(kCropCount, kFeatureCount);
    snap->forest.fit(XTrain, yTrain, options.forest, deadline);

    snap->metrics.trainAccuracy = accuracy(snap->forest, XTrain, yTrain);
    snap->metrics.trainSamples = XTrain.size();
    snap->metrics.features = kFeatureCount;
    snap->metrics.classes = kCropCount;
    snap->metrics.trainedAt = utcTimestamp();
    scoreHoldout(*snap, holdout, snap->metrics);
    return TrainedModel{snap, std::move(holdout)};
}

SnapshotPtr trainSnapshot(const std::vector<LabeledSample>& samples, const TrainerOptions& options,
                          const std::string& version, std::chrono::steady_clock::time_point deadline){
    return trainModel(samples, options, version, deadline).snapshot;
}

void scoreHoldout(const ModelSnapshot& snapshot, const std::vector<LabeledSample>& holdout, TrainingMetrics& metrics){
    std::map<std::string, std::pair<std::size_t, std::size_t>> tally;  // hits, rows
    std::size_t hits = 0;
    for(const auto& s : holdout){
        auto& t = tally[s.label];
        ++t.second;
        if(Predictor::predict(s.raw, snapshot).predictedCrop == s.label){ ++hits; ++t.first; }
    }
    metrics.testSamples = holdout.size();
    metrics.testAccuracy = holdout.empty() ? 0.0 : static_cast<double>(hits) / static_cast<double>(holdout.size());
    metrics.classRecall.clear();
    for(const auto& kv : tally){
        metrics.classRecall[kv.first] = static_cast<double>(kv.second.first) / static_cast<double>(kv.second.second);
    }
}

DatasetTrainer datasetTrainer(const TrainerOptions& options){
    return [options](const std::string& csvPath, const std::string& version, std::chrono::steady_clock::time_point deadline){
        return trainModel(loadDataset(csvPath), options, version, deadline);
    };
}

}  // namespace CropAdvisor
