#include "AdvisorConfig.hpp"
#include "Errors.hpp"
#include "ModelStore.hpp"
#include "Trainer.hpp"
#include <iomanip>
#include <iostream>
#include <string>

using namespace CropAdvisor;

// Produces the initial artifact set: advisor_train <dataset.csv> [model_dir] [config]
int main(int argc, char** argv){
    if(argc < 2){
        std::cerr << "usage: " << argv[0] << " <dataset.csv> [model_dir] [config]" << std::endl;
        return 1;
    }
    AdvisorConfig config;
    if(argc > 3 && !loadConfig(argv[3], config)){
        std::cerr << "advisor_train: malformed config " << argv[3] << std::endl;
        return 1;
    }
    const std::string dataPath = argv[1];
    const std::string modelDir = (argc > 2) ? argv[2] : config.modelDir;

    SnapshotPtr snap;
    try {
        snap = trainSnapshot(loadDataset(dataPath), config.trainer, "bootstrap-" + utcTimestamp());
    } catch(const AdvisorError& e){
        std::cerr << "advisor_train: " << e.what() << std::endl;
        return 2;
    }
    try {
        ModelStore::saveArtifacts(modelDir, *snap);
    } catch(const std::runtime_error& e){
        std::cerr << "advisor_train: cannot save artifacts: " << e.what() << std::endl;
        return 3;
    }

    const TrainingMetrics& m = snap->metrics;
    std::cout << std::fixed << std::setprecision(4)
              << "version " << snap->version << "\n"
              << "train_accuracy " << m.trainAccuracy << "\n"
              << "test_accuracy " << m.testAccuracy << "\n"
              << "train_samples " << m.trainSamples << "\n"
              << "test_samples " << m.testSamples << "\n"
              << "features " << m.features << "\n"
              << "classes " << m.classes << "\n";
    for(const auto& kv : m.classRecall) std::cout << "recall " << kv.first << " " << kv.second << "\n";
    std::cout << "saved " << modelDir << std::endl;
    return 0;
}
