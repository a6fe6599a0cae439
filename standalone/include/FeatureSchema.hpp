#pragma once
#include <array>
#include <cstddef>
#include <string>

namespace CropAdvisor {

// Soil and climate measurements as submitted by the caller.
struct RawSample {
    double N{0};
    double P{0};
    double K{0};
    double temperature{0};
    double humidity{0};
    double ph{0};
    double rainfall{0};
};

struct RawField {
    const char* name;
    double RawSample::*member;
    double lo;
    double hi;
};

constexpr std::size_t kRawFieldCount = 7;
constexpr std::size_t kFeatureCount = 13;
constexpr std::size_t kCropCount = 22;

// Declared ranges, inclusive on both ends.
constexpr std::array<RawField, kRawFieldCount> kRawFields{{
    {"N", &RawSample::N, 0.0, 200.0},
    {"P", &RawSample::P, 0.0, 200.0},
    {"K", &RawSample::K, 0.0, 250.0},
    {"temperature", &RawSample::temperature, 0.0, 50.0},
    {"humidity", &RawSample::humidity, 0.0, 100.0},
    {"ph", &RawSample::ph, 0.0, 14.0},
    {"rainfall", &RawSample::rainfall, 0.0, 400.0},
}};

// Category thresholds. Training and serving both read these; the transform
// artifact records them and a mismatch refuses to load.
constexpr double kRainfallLowMax = 50.0;
constexpr double kRainfallMediumMax = 100.0;
constexpr double kRainfallHighMax = 200.0;
constexpr double kPhAcidicBelow = 5.5;
constexpr double kPhNeutralMax = 7.5;

enum Feature : std::size_t {
    kN = 0,
    kP,
    kK,
    kTemperature,
    kHumidity,
    kPh,
    kRainfall,
    kNpkAvg,
    kThi,
    kRainfallLevel,
    kPhCategory,
    kTempRainfallInteraction,
    kPhRainfallInteraction,
};

constexpr std::array<const char*, kFeatureCount> kFeatureNames{{
    "N", "P", "K", "temperature", "humidity", "ph", "rainfall",
    "NPK_avg", "THI", "rainfall_level", "ph_category",
    "temp_rainfall_interaction", "ph_rainfall_interaction",
}};

// Sorted, matching the label encoder order used at training time.
constexpr std::array<const char*, kCropCount> kCropLabels{{
    "apple", "banana", "blackgram", "chickpea", "coconut", "coffee",
    "cotton", "grapes", "jute", "kidneybeans", "lentil", "maize",
    "mango", "mothbeans", "mungbean", "muskmelon", "orange", "papaya",
    "pigeonpeas", "pomegranate", "rice", "watermelon",
}};

using EngineeredFeatureVector = std::array<double, kFeatureCount>;

}  // namespace CropAdvisor
