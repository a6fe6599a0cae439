#include "RetrainOrchestrator.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace CropAdvisor {

namespace {

constexpr std::size_t kJobHistory = 32;

std::string makeVersion(std::uint32_t id){
    const std::time_t now = std::time(nullptr);
    std::tm tm{};
    gmtime_r(&now, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y%m%dT%H%M%SZ") << "-r" << id;
    return oss.str();
}

}  // namespace

const char* retrainPhaseName(RetrainPhase phase){
    switch(phase){
        case RetrainPhase::Idle: return "idle";
        case RetrainPhase::Training: return "training";
        case RetrainPhase::Validating: return "validating";
        case RetrainPhase::Publishing: return "publishing";
        case RetrainPhase::Failed: return "failed";
    }
    return "unknown";
}

RetrainOrchestrator::RetrainOrchestrator(ModelStore& store, TrainFunction train, RetrainPolicy policy)
: store(store), train(std::move(train)), rules(std::move(policy)) {}

RetrainOrchestrator::~RetrainOrchestrator(){
    wait();
}

std::uint32_t RetrainOrchestrator::start(const std::string& dataPath){
    bool idle = false;
    if(!running.compare_exchange_strong(idle, true)){
        std::lock_guard<std::mutex> lock(mu);
        throw RetrainInProgressError(nextId - 1);
    }

    std::lock_guard<std::mutex> workerLock(workerMu);
    if(worker.joinable()) worker.join();  // previous job already cleared the flag

    std::uint32_t id = 0;
    {
        std::lock_guard<std::mutex> lock(mu);
        id = nextId++;
        RetrainJob job;
        job.id = id;
        job.dataPath = dataPath;
        job.phase = RetrainPhase::Training;
        jobs[id] = job;
        while(jobs.size() > kJobHistory) jobs.erase(jobs.begin());
        current = RetrainPhase::Training;
    }

    try {
        worker = std::thread(&RetrainOrchestrator::run, this, id, dataPath);
    } catch(const std::system_error& e){
        finish(id, false, std::string("could not start the training thread: ") + e.what());
        current = RetrainPhase::Idle;
        running = false;
        throw;
    }
    return id;
}

std::optional<RetrainJob> RetrainOrchestrator::job(std::uint32_t id) const{
    std::lock_guard<std::mutex> lock(mu);
    const auto it = jobs.find(id);
    if(it == jobs.end()) return std::nullopt;
    return it->second;
}

std::optional<RetrainJob> RetrainOrchestrator::latestJob() const{
    std::lock_guard<std::mutex> lock(mu);
    if(jobs.empty()) return std::nullopt;
    return jobs.rbegin()->second;
}

void RetrainOrchestrator::wait(){
    std::lock_guard<std::mutex> workerLock(workerMu);
    if(worker.joinable()) worker.join();
}

void RetrainOrchestrator::enter(std::uint32_t id, RetrainPhase phase){
    std::lock_guard<std::mutex> lock(mu);
    const auto it = jobs.find(id);
    if(it != jobs.end()) it->second.phase = phase;
    current = phase;
}

void RetrainOrchestrator::finish(std::uint32_t id, bool published, const std::string& message){
    std::lock_guard<std::mutex> lock(mu);
    const auto it = jobs.find(id);
    if(it != jobs.end()){
        it->second.finished = true;
        it->second.published = published;
        it->second.message = message;
        it->second.phase = published ? RetrainPhase::Idle : RetrainPhase::Failed;
    }
    current = published ? RetrainPhase::Idle : RetrainPhase::Failed;
}

void RetrainOrchestrator::run(std::uint32_t id, std::string dataPath){
    attempt(id, dataPath);
    current = RetrainPhase::Idle;
    running = false;
}

void RetrainOrchestrator::attempt(std::uint32_t id, const std::string& dataPath){
    const Deadline deadline = std::chrono::steady_clock::now() + rules.timeout;
    const std::string version = makeVersion(id);

    TrainedModel trained;
    try {
        trained = train(dataPath, version, deadline);
        if(!trained.snapshot) throw TrainingFailedError("training produced no model");
        if(std::chrono::steady_clock::now() > deadline) throw TrainingFailedError("training exceeded its time limit");
    } catch(const std::exception& e){
        finish(id, false, std::string("training failed: ") + e.what());
        return;
    }

    enter(id, RetrainPhase::Validating);
    if(!hasCropLabelSet(trained.snapshot->labels)){
        finish(id, false, "candidate label set does not match the supported crops");
        return;
    }
    if(trained.holdout.empty()){
        finish(id, false, "candidate has no held-out rows to validate against");
        return;
    }
    auto checked = std::make_shared<ModelSnapshot>(*trained.snapshot);
    try {
        scoreHoldout(*checked, trained.holdout, checked->metrics);
    } catch(const std::exception& e){
        finish(id, false, std::string("validation failed: ") + e.what());
        return;
    }
    const SnapshotPtr candidate = checked;
    {
        std::lock_guard<std::mutex> lock(mu);
        const auto it = jobs.find(id);
        if(it != jobs.end()){ it->second.metrics = candidate->metrics; it->second.version = candidate->version; }
    }
    const SnapshotPtr previous = store.current();
    double floor = rules.minAccuracy;
    if(previous) floor = std::max(floor, previous->metrics.testAccuracy - rules.maxRegression);
    if(candidate->metrics.testAccuracy < floor){
        std::ostringstream msg;
        msg << "held-out accuracy " << candidate->metrics.testAccuracy << " is below the required " << floor;
        if(previous) msg << "; keeping snapshot " << previous->version;
        finish(id, false, msg.str());
        return;
    }

    enter(id, RetrainPhase::Publishing);
    try {
        if(!rules.artifactDir.empty()) ModelStore::saveArtifacts(rules.artifactDir, *candidate);
    } catch(const std::exception& e){
        finish(id, false, std::string("publishing failed: ") + e.what());
        return;
    }
    store.publish(candidate);
    finish(id, true, "published snapshot " + candidate->version);
}

}  // namespace CropAdvisor
