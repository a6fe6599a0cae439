#include "AdvisorConfig.hpp"
#include "Errors.hpp"
#include "ModelStore.hpp"
#include "RequestRouter.hpp"
#include "RetrainOrchestrator.hpp"
#include "ServiceFacade.hpp"
#include "Trainer.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>

using namespace CropAdvisor;

static bool exists(const std::string& p){ std::ifstream f(p); return f.good(); }

// Serves JSON-lines requests from a file or stdin, one response per line on stdout.
int main(int argc, char** argv){
    std::string config_path = "deployments/CropAdvisor/config/advisor.cfg";
    if(const char* env = std::getenv("ADVISOR_CONFIG")) config_path = env;
    else if(!exists(config_path)) config_path = "../deployments/CropAdvisor/config/advisor.cfg";

    AdvisorConfig config;
    if(!loadConfig(config_path, config)){
        std::cerr << "advisor: malformed config " << config_path << std::endl;
        return 1;
    }
    if(const char* env = std::getenv("ADVISOR_MODEL_DIR")) config.modelDir = env;

    ModelStore store;
    try {
        store.publish(ModelStore::loadArtifacts(config.modelDir));
    } catch(const ModelLoadError& e){
        std::cerr << "advisor: cannot load model from " << config.modelDir << ": " << e.what() << std::endl;
        return 2;
    }

    RetrainOrchestrator retrainer(store, datasetTrainer(config.trainer), config.retrainPolicy());
    ServiceFacade facade(store, retrainer, config.dataPath);
    RequestRouter router(facade);

    std::istream* in = &std::cin; std::ifstream f;
    if(argc>1){
        f.open(argv[1]);
        if(!f){ std::cerr << "advisor: cannot open " << argv[1] << std::endl; return 1; }
        in = &f;
    }
    std::string line;
    while(std::getline(*in, line)){
        if(line.find_first_not_of(" \t\r") == std::string::npos) continue;
        std::cout << router.handleLine(line) << std::endl;
    }

    retrainer.wait();
    if(const auto job = retrainer.latestJob()){
        std::cerr << "advisor: retrain job " << job->id << " " << retrainPhaseName(job->phase)
                  << (job->published ? " published " : " ") << job->message << std::endl;
    }
    std::cerr << "advisor: served " << router.predictionsServed() << " predictions, "
              << router.requestErrors() << " request errors" << std::endl;
    return 0;
}
