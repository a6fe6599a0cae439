#include "ModelStore.hpp"
#include "Errors.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace CropAdvisor {

bool hasCropLabelSet(const std::vector<std::string>& labels){
    if(labels.size() != kCropCount) return false;
    for(std::size_t i=0;i<kCropCount;++i){ if(labels[i] != kCropLabels[i]) return false; }
    return true;
}

SnapshotPtr ModelStore::current() const{
    std::lock_guard<std::mutex> lock(mu);
    return active;
}

void ModelStore::publish(SnapshotPtr next){
    std::lock_guard<std::mutex> lock(mu);
    active = std::move(next);
}

namespace {

constexpr const char* kCurrentLink = "current";

std::ifstream openArtifact(const std::string& dir, const char* name){
    std::ifstream in(ModelStore::artifactPath(dir, name));
    if(!in) throw ModelLoadError(std::string(name) + " is missing or unreadable");
    return in;
}

std::string readHeader(std::istream& in, const char* name){
    std::string line;
    while(std::getline(in, line)){
        std::istringstream s(line);
        std::string k, v;
        if(!(s >> k)) continue;
        if(k == "snapshot" && (s >> v)) return v;
        break;
    }
    throw ModelLoadError(std::string(name) + " has no snapshot header");
}

std::vector<std::string> readLabels(std::istream& in){
    std::string line;
    while(std::getline(in, line)){
        std::istringstream s(line);
        std::string k;
        if(!(s >> k)) continue;
        if(k != "labels") break;
        std::vector<std::string> labels;
        for(std::string l; s >> l;) labels.push_back(l);
        return labels;
    }
    throw ModelLoadError(std::string(kForestArtifact) + " has no label list");
}

TrainingMetrics readMetrics(std::istream& in){
    TrainingMetrics m;
    std::string line;
    while(std::getline(in, line)){
        std::istringstream s(line);
        std::string k;
        if(!(s >> k)) continue;
        bool ok = true;
        if(k == "train_accuracy") ok = static_cast<bool>(s >> m.trainAccuracy);
        else if(k == "test_accuracy") ok = static_cast<bool>(s >> m.testAccuracy);
        else if(k == "train_samples") ok = static_cast<bool>(s >> m.trainSamples);
        else if(k == "test_samples") ok = static_cast<bool>(s >> m.testSamples);
        else if(k == "features") ok = static_cast<bool>(s >> m.features);
        else if(k == "classes") ok = static_cast<bool>(s >> m.classes);
        else if(k == "trained_at") ok = static_cast<bool>(s >> m.trainedAt);
        else if(k == "recall"){
            std::string crop; double r = 0.0;
            ok = (s >> crop >> r) && r >= 0.0 && r <= 1.0;
            if(ok) m.classRecall[crop] = r;
        }
        if(!ok) throw ModelLoadError(std::string(kMetricsArtifact) + " has a malformed " + k + " record");
    }
    return m;
}

void writeMetrics(std::ostream& out, const TrainingMetrics& m){
    out.precision(17);
    out << "train_accuracy " << m.trainAccuracy << "\n";
    out << "test_accuracy " << m.testAccuracy << "\n";
    out << "train_samples " << m.trainSamples << "\n";
    out << "test_samples " << m.testSamples << "\n";
    out << "features " << m.features << "\n";
    out << "classes " << m.classes << "\n";
    if(!m.trainedAt.empty()) out << "trained_at " << m.trainedAt << "\n";
    for(const auto& kv : m.classRecall) out << "recall " << kv.first << " " << kv.second << "\n";
}

template <typename Body>
void writeArtifact(const fs::path& path, const char* name, const std::string& version, Body body){
    std::ofstream out(path, std::ios::trunc);
    if(!out) throw std::runtime_error(std::string("cannot open ") + name + " for writing");
    out << "snapshot " << version << "\n";
    body(out);
    out.close();
    if(!out) throw std::runtime_error(std::string("failed to write ") + name);
}

}  // namespace

SnapshotPtr ModelStore::loadArtifacts(const std::string& dir){
    auto snap = std::make_shared<ModelSnapshot>();

    std::ifstream forestIn = openArtifact(dir, kForestArtifact);
    const std::string forestVersion = readHeader(forestIn, kForestArtifact);
    snap->labels = readLabels(forestIn);
    if(!snap->forest.load(forestIn)) throw ModelLoadError(std::string(kForestArtifact) + " is malformed");
    if(!hasCropLabelSet(snap->labels)) throw ModelLoadError(std::string(kForestArtifact) + " label set does not match the supported crops");
    if(snap->forest.classCount() != snap->labels.size()) throw ModelLoadError(std::string(kForestArtifact) + " class count does not match its labels");
    if(snap->forest.featureCount() != kFeatureCount) throw ModelLoadError(std::string(kForestArtifact) + " was trained on a different feature set");

    std::ifstream transformIn = openArtifact(dir, kTransformArtifact);
    const std::string transformVersion = readHeader(transformIn, kTransformArtifact);
    if(!snap->transform.load(transformIn)){
        throw ModelLoadError(std::string(kTransformArtifact) + " is malformed or its category thresholds differ from the serving thresholds");
    }

    std::ifstream metricsIn = openArtifact(dir, kMetricsArtifact);
    const std::string metricsVersion = readHeader(metricsIn, kMetricsArtifact);
    snap->metrics = readMetrics(metricsIn);

    if(forestVersion != transformVersion || forestVersion != metricsVersion){
        throw ModelLoadError("artifacts belong to different snapshots (forest " + forestVersion + ", transform " +
                             transformVersion + ", metrics " + metricsVersion + ")");
    }
    snap->version = forestVersion;
    return snap;
}

std::string ModelStore::artifactPath(const std::string& dir, const char* name){
    const fs::path linked = fs::path(dir) / kCurrentLink;
    std::error_code ec;
    if(fs::is_directory(linked, ec)) return (linked / name).string();
    return (fs::path(dir) / name).string();
}

void ModelStore::saveArtifacts(const std::string& dir, const ModelSnapshot& snapshot){
    const fs::path target(dir);
    const fs::path staging = target / (".staging-" + snapshot.version);
    std::error_code ec;
    fs::remove_all(staging, ec);
    fs::create_directories(staging, ec);
    if(ec) throw std::runtime_error("cannot create the model staging directory");

    writeArtifact(staging / kForestArtifact, kForestArtifact, snapshot.version, [&](std::ostream& out){
        out << "labels";
        for(const auto& l : snapshot.labels) out << " " << l;
        out << "\n";
        snapshot.forest.save(out);
    });
    writeArtifact(staging / kTransformArtifact, kTransformArtifact, snapshot.version,
                  [&](std::ostream& out){ snapshot.transform.save(out); });
    writeArtifact(staging / kMetricsArtifact, kMetricsArtifact, snapshot.version,
                  [&](std::ostream& out){ writeMetrics(out, snapshot.metrics); });

    fs::path entry = "snapshot-" + snapshot.version;
    for(int n=1; fs::exists(target / entry); ++n) entry = "snapshot-" + snapshot.version + "-" + std::to_string(n);
    fs::rename(staging, target / entry, ec);
    if(ec) throw std::runtime_error("cannot move snapshot " + snapshot.version + " into place");

    // the three artifacts switch together with one rename of the link
    const fs::path link = target / kCurrentLink;
    fs::path previous;
    if(fs::is_symlink(link, ec)) previous = fs::read_symlink(link, ec);
    const fs::path pending = target / ".current.pending";
    fs::remove(pending, ec);
    fs::create_directory_symlink(entry, pending, ec);
    if(ec) throw std::runtime_error("cannot link snapshot " + snapshot.version);
    fs::rename(pending, link, ec);
    if(ec) throw std::runtime_error("cannot switch the current snapshot to " + snapshot.version);
    if(!previous.empty() && previous != entry) fs::remove_all(target / previous, ec);
}

}  // namespace CropAdvisor
