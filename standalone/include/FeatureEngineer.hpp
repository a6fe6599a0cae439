#pragma once
#include "FeatureSchema.hpp"
#include <vector>

namespace CropAdvisor {

// Throws ValidationError naming the first offending field.
void validate(const RawSample& raw);

EngineeredFeatureVector engineer(const RawSample& raw);

// Ordinal categories, exposed for the tests and the trainer.
double rainfallLevel(double rainfall);
double phCategory(double ph);

}  // namespace CropAdvisor
