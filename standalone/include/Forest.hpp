#pragma once
#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

namespace CropAdvisor {

struct ForestNode { int f; double t; int l; int r; bool leaf; std::vector<double> p; };
struct ForestTree { std::vector<ForestNode> n; };

struct ForestParams {
    int trees = 100;
    int maxDepth = 12;
    int minSamplesLeaf = 1;
    int maxFeatures = 0;  // 0 = sqrt(feature count)
    std::uint32_t seed = 42;
};

class Forest {
public:
    using Clock = std::chrono::steady_clock;

    Forest() = default;
    Forest(std::size_t classCount, std::size_t featureCount);

    // Bagged CART trees with gini splits. Throws TrainingFailedError when the
    // deadline passes between two trees.
    void fit(const std::vector<std::vector<double>>& X, const std::vector<int>& y,
             const ForestParams& params, Clock::time_point deadline = Clock::time_point::max());

    // Mean leaf distribution over the trees, normalized. Throws InferenceError
    // when the trees yield no usable probability mass.
    std::vector<double> proba(const std::vector<double>& x) const;

    bool load(std::istream& in);
    void save(std::ostream& out) const;

    std::size_t classCount() const { return classes; }
    std::size_t featureCount() const { return features; }
    std::size_t treeCount() const { return trees.size(); }
    bool hasImportances() const { return !importance.empty(); }
    const std::vector<double>& importances() const { return importance; }

private:
    std::vector<ForestTree> trees;
    std::size_t classes = 0;
    std::size_t features = 0;
    std::vector<double> importance;
};

}  // namespace CropAdvisor
