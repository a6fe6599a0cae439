#include "AdvisorConfig.hpp"
#include <fstream>
#include <sstream>

namespace CropAdvisor {

RetrainPolicy AdvisorConfig::retrainPolicy() const{
    RetrainPolicy p;
    p.minAccuracy = minAccuracy;
    p.maxRegression = maxRegression;
    p.timeout = std::chrono::seconds(trainTimeoutSeconds);
    p.artifactDir = modelDir;
    return p;
}

bool loadConfig(const std::string& path, AdvisorConfig& config){
    std::ifstream in(path);
    if(!in) return true;  // defaults
    bool ok = true;
    std::string line;
    while(std::getline(in, line)){
        const auto hash = line.find('#');
        if(hash != std::string::npos) line.erase(hash);
        std::istringstream s(line);
        std::string k;
        if(!(s >> k)) continue;
        bool parsed = true;
        if(k == "model_dir") parsed = static_cast<bool>(s >> config.modelDir);
        else if(k == "data_path") parsed = static_cast<bool>(s >> config.dataPath);
        else if(k == "socket_path") parsed = static_cast<bool>(s >> config.socketPath);
        else if(k == "min_accuracy") parsed = static_cast<bool>(s >> config.minAccuracy);
        else if(k == "max_regression") parsed = static_cast<bool>(s >> config.maxRegression);
        else if(k == "train_timeout_s") parsed = static_cast<bool>(s >> config.trainTimeoutSeconds) && config.trainTimeoutSeconds > 0;
        else if(k == "test_fraction") parsed = static_cast<bool>(s >> config.trainer.testFraction);
        else if(k == "seed") parsed = static_cast<bool>(s >> config.trainer.seed);
        else if(k == "trees") parsed = static_cast<bool>(s >> config.trainer.forest.trees) && config.trainer.forest.trees > 0;
        else if(k == "max_depth") parsed = static_cast<bool>(s >> config.trainer.forest.maxDepth);
        else if(k == "min_samples_leaf") parsed = static_cast<bool>(s >> config.trainer.forest.minSamplesLeaf);
        else if(k == "max_features") parsed = static_cast<bool>(s >> config.trainer.forest.maxFeatures);
        if(!parsed) ok = false;
    }
    config.trainer.forest.seed = config.trainer.seed;
    return ok;
}

}  // namespace CropAdvisor
