#include "FeatureTransform.hpp"
#include <cmath>
#include <istream>
#include <ostream>
#include <sstream>
#include <string>

namespace CropAdvisor {

static int s_featureIndex(const std::string& name){
    for(std::size_t i=0;i<kFeatureCount;++i){ if(name == kFeatureNames[i]) return static_cast<int>(i); }
    return -1;
}

FeatureTransform::FeatureTransform(){
    mu.fill(0.0);
    sd.fill(1.0);
}

void FeatureTransform::fit(const std::vector<EngineeredFeatureVector>& rows){
    mu.fill(0.0);
    sd.fill(1.0);
    if(rows.empty()) return;
    const double n = static_cast<double>(rows.size());
    for(const auto& r : rows){ for(std::size_t i=0;i<kFeatureCount;++i) mu[i] += r[i]; }
    for(std::size_t i=0;i<kFeatureCount;++i) mu[i] /= n;
    EngineeredFeatureVector var{};
    for(const auto& r : rows){
        for(std::size_t i=0;i<kFeatureCount;++i){ const double d = r[i]-mu[i]; var[i] += d*d; }
    }
    for(std::size_t i=0;i<kFeatureCount;++i){
        const double s = std::sqrt(var[i]/n);
        // constant columns pass through unscaled
        sd[i] = (s > 0.0 && std::isfinite(s)) ? s : 1.0;
    }
}

std::vector<double> FeatureTransform::apply(const EngineeredFeatureVector& x) const{
    std::vector<double> out(kFeatureCount);
    for(std::size_t i=0;i<kFeatureCount;++i) out[i] = (x[i]-mu[i])/sd[i];
    return out;
}

bool FeatureTransform::load(std::istream& in){
    bool bins=false, bounds=false;
    std::array<bool, kFeatureCount> haveMean{}, haveScale{};
    std::string line;
    while(std::getline(in, line)){
        std::istringstream s(line);
        std::string k;
        if(!(s >> k)) continue;
        if(k == "rainfall_bins"){
            double a, b, c;
            if(!(s >> a >> b >> c)) return false;
            if(a != kRainfallLowMax || b != kRainfallMediumMax || c != kRainfallHighMax) return false;
            bins = true;
        } else if(k == "ph_bounds"){
            double a, b;
            if(!(s >> a >> b)) return false;
            if(a != kPhAcidicBelow || b != kPhNeutralMax) return false;
            bounds = true;
        } else if(k == "mean" || k == "scale"){
            std::string name; double v;
            if(!(s >> name >> v)) return false;
            const int i = s_featureIndex(name);
            if(i < 0 || !std::isfinite(v)) return false;
            if(k == "mean"){ mu[i] = v; haveMean[i] = true; }
            else { if(v <= 0.0) return false; sd[i] = v; haveScale[i] = true; }
        }
    }
    for(std::size_t i=0;i<kFeatureCount;++i){ if(!haveMean[i] || !haveScale[i]) return false; }
    return bins && bounds;
}

void FeatureTransform::save(std::ostream& out) const{
    out.precision(17);
    out << "rainfall_bins " << kRainfallLowMax << " " << kRainfallMediumMax << " " << kRainfallHighMax << "\n";
    out << "ph_bounds " << kPhAcidicBelow << " " << kPhNeutralMax << "\n";
    for(std::size_t i=0;i<kFeatureCount;++i) out << "mean " << kFeatureNames[i] << " " << mu[i] << "\n";
    for(std::size_t i=0;i<kFeatureCount;++i) out << "scale " << kFeatureNames[i] << " " << sd[i] << "\n";
}

}  // namespace CropAdvisor
