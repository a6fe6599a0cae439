#include "FeatureEngineer.hpp"
#include "Errors.hpp"
#include <cmath>
#include <sstream>

namespace CropAdvisor {

void validate(const RawSample& raw){
    for(const auto& field : kRawFields){
        const double v = raw.*(field.member);
        if(std::isfinite(v) && v >= field.lo && v <= field.hi) continue;
        std::ostringstream bound; bound << "[" << field.lo << ", " << field.hi << "]";
        std::ostringstream msg;
        msg << field.name << " must be within " << bound.str();
        if(std::isfinite(v)) msg << ", got " << v;
        else msg << ", got a non-finite value";
        throw ValidationError(field.name, bound.str(), msg.str());
    }
}

double rainfallLevel(double rainfall){
    if(rainfall <= kRainfallLowMax) return 0.0;
    if(rainfall <= kRainfallMediumMax) return 1.0;
    if(rainfall <= kRainfallHighMax) return 2.0;
    return 3.0;
}

double phCategory(double ph){
    if(ph < kPhAcidicBelow) return 0.0;
    if(ph <= kPhNeutralMax) return 1.0;
    return 2.0;
}

EngineeredFeatureVector engineer(const RawSample& raw){
    validate(raw);
    EngineeredFeatureVector x{};
    x[kN] = raw.N;
    x[kP] = raw.P;
    x[kK] = raw.K;
    x[kTemperature] = raw.temperature;
    x[kHumidity] = raw.humidity;
    x[kPh] = raw.ph;
    x[kRainfall] = raw.rainfall;
    x[kNpkAvg] = (raw.N + raw.P + raw.K) / 3.0;
    x[kThi] = raw.temperature * raw.humidity / 100.0;
    x[kRainfallLevel] = rainfallLevel(raw.rainfall);
    x[kPhCategory] = phCategory(raw.ph);
    x[kTempRainfallInteraction] = raw.temperature * raw.rainfall;
    x[kPhRainfallInteraction] = raw.ph * raw.rainfall;
    return x;
}

}  // namespace CropAdvisor
