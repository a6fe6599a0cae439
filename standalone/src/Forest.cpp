#include "Forest.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cmath>
#include <istream>
#include <numeric>
#include <ostream>
#include <random>

namespace CropAdvisor {

namespace {

double gini(const std::vector<double>& counts, double n){
    if(n <= 0) return 0.0;
    double s = 1.0;
    for(double c : counts){ const double q = c/n; s -= q*q; }
    return s;
}

struct TreeBuilder {
    const std::vector<std::vector<double>>& X;
    const std::vector<int>& y;
    std::size_t classes;
    std::size_t features;
    const ForestParams& params;
    std::size_t mtry;
    std::mt19937& rng;
    ForestTree tree;
    std::vector<double> gain;

    ForestNode makeNode(const std::vector<double>& counts, double n) const{
        ForestNode nd{-1, 0.0, -1, -1, true, std::vector<double>(classes, 0.0)};
        for(std::size_t c=0;c<classes;++c) nd.p[c] = counts[c]/n;
        return nd;
    }

    int build(const std::vector<int>& idx, int depth){
        const double n = static_cast<double>(idx.size());
        std::vector<double> counts(classes, 0.0);
        for(int i : idx) counts[y[i]] += 1.0;
        ForestNode node = makeNode(counts, n);
        const double impurity = gini(counts, n);
        const std::size_t minLeaf = static_cast<std::size_t>(std::max(1, params.minSamplesLeaf));

        const bool depthDone = params.maxDepth > 0 && depth >= params.maxDepth;
        if(depthDone || idx.size() < 2*minLeaf || impurity <= 0.0){
            tree.n.push_back(node);
            return static_cast<int>(tree.n.size())-1;
        }

        std::vector<std::size_t> order(features);
        std::iota(order.begin(), order.end(), 0);
        std::shuffle(order.begin(), order.end(), rng);

        int bestF = -1;
        double bestT = 0.0, bestScore = impurity, bestGl = 0.0, bestGr = 0.0;
        std::size_t bestNl = 0;
        std::size_t visited = 0;
        std::vector<int> sorted(idx);
        for(std::size_t f : order){
            if(visited >= mtry) break;
            std::sort(sorted.begin(), sorted.end(), [&](int a, int b){ return X[a][f] < X[b][f]; });
            if(X[sorted.front()][f] == X[sorted.back()][f]) continue;  // constant here
            ++visited;
            std::vector<double> left(classes, 0.0);
            std::vector<double> right(counts);
            for(std::size_t k=0;k+1<sorted.size();++k){
                const int c = y[sorted[k]];
                left[c] += 1.0; right[c] -= 1.0;
                const double a = X[sorted[k]][f], b = X[sorted[k+1]][f];
                if(a == b) continue;
                const std::size_t nl = k+1, nr = sorted.size()-nl;
                if(nl < minLeaf || nr < minLeaf) continue;
                const double gl = gini(left, static_cast<double>(nl));
                const double gr = gini(right, static_cast<double>(nr));
                const double score = (nl*gl + nr*gr)/n;
                if(score < bestScore){
                    bestScore = score; bestF = static_cast<int>(f); bestNl = nl; bestGl = gl; bestGr = gr;
                    bestT = 0.5*(a+b);
                    if(bestT >= b) bestT = a;
                }
            }
        }

        if(bestF < 0){
            tree.n.push_back(node);
            return static_cast<int>(tree.n.size())-1;
        }

        std::vector<int> l, r;
        for(int i : idx) (X[i][bestF] <= bestT ? l : r).push_back(i);
        const double nl = static_cast<double>(bestNl), nr = n - nl;
        gain[bestF] += n*impurity - nl*bestGl - nr*bestGr;

        node.f = bestF; node.t = bestT; node.leaf = false;
        const int self = static_cast<int>(tree.n.size());
        tree.n.push_back(node);
        const int li = build(l, depth+1);
        const int ri = build(r, depth+1);
        tree.n[self].l = li;
        tree.n[self].r = ri;
        return self;
    }
};

}  // namespace

Forest::Forest(std::size_t classCount, std::size_t featureCount) : classes(classCount), features(featureCount) {}

void Forest::fit(const std::vector<std::vector<double>>& X, const std::vector<int>& y,
                 const ForestParams& params, Clock::time_point deadline){
    if(classes == 0 || features == 0) throw TrainingFailedError("forest shape is not set");
    if(X.empty() || X.size() != y.size()) throw TrainingFailedError("training set is empty or unlabeled");
    if(params.trees <= 0) throw TrainingFailedError("forest needs at least one tree");
    for(std::size_t i=0;i<X.size();++i){
        if(X[i].size() != features) throw TrainingFailedError("training row has the wrong feature count");
        if(y[i] < 0 || static_cast<std::size_t>(y[i]) >= classes) throw TrainingFailedError("training label out of range");
    }

    std::size_t mtry = params.maxFeatures > 0
        ? std::min<std::size_t>(static_cast<std::size_t>(params.maxFeatures), features)
        : static_cast<std::size_t>(std::lround(std::sqrt(static_cast<double>(features))));
    mtry = std::max<std::size_t>(1, mtry);

    std::vector<ForestTree> grown;
    std::vector<double> total(features, 0.0);
    for(int t=0;t<params.trees;++t){
        if(Clock::now() > deadline) throw TrainingFailedError("training exceeded its time limit");
        std::mt19937 rng(params.seed + static_cast<std::uint32_t>(t));
        std::uniform_int_distribution<int> pick(0, static_cast<int>(X.size())-1);
        std::vector<int> idx(X.size());
        for(auto& i : idx) i = pick(rng);

        TreeBuilder b{X, y, classes, features, params, mtry, rng, ForestTree{}, std::vector<double>(features, 0.0)};
        b.build(idx, 0);
        const double g = std::accumulate(b.gain.begin(), b.gain.end(), 0.0);
        if(g > 0.0){ for(std::size_t f=0;f<features;++f) total[f] += b.gain[f]/g; }
        grown.push_back(std::move(b.tree));
    }

    const double sum = std::accumulate(total.begin(), total.end(), 0.0);
    if(sum > 0.0){ for(auto& v : total) v /= sum; }
    trees = std::move(grown);
    importance = std::move(total);
}

std::vector<double> Forest::proba(const std::vector<double>& x) const{
    if(trees.empty()) throw InferenceError("classifier has no trees");
    if(x.size() != features) throw InferenceError("classifier expects " + std::to_string(features) + " features");
    std::vector<double> acc(classes, 0.0);
    for(const auto& t : trees){
        int i=0;
        while(!t.n[i].leaf){
            const auto& nd = t.n[i];
            i = (x[nd.f] <= nd.t) ? nd.l : nd.r;
        }
        for(std::size_t c=0;c<classes;++c) acc[c] += t.n[i].p[c];
    }
    double Z = 0;
    for(double a : acc) Z += a;
    if(!(Z > 0) || !std::isfinite(Z)) throw InferenceError("classifier produced no usable probability mass");
    for(auto& a : acc) a /= Z;
    return acc;
}

bool Forest::load(std::istream& in){
    // header counts are untrusted: storage grows only with values actually read
    std::string tag; std::size_t T=0, C=0, F=0;
    if(!(in >> tag >> T >> C >> F) || tag != "forest" || T == 0 || C == 0 || F == 0) return false;
    std::vector<double> imp;
    if(!(in >> tag)) return false;
    if(tag == "importance"){
        for(std::size_t k=0;k<F;++k){
            double v;
            if(!(in >> v) || !std::isfinite(v) || v < 0) return false;
            imp.push_back(v);
        }
        if(!(in >> tag)) return false;
    }
    std::vector<ForestTree> loaded;
    for(std::size_t t=0;t<T;++t){
        if(t > 0 && !(in >> tag)) return false;
        int N = 0;
        if(tag != "tree" || !(in >> N) || N <= 0) return false;
        ForestTree tr;
        for(int i=0;i<N;++i){
            int idx, f, l, r; double th;
            if(!(in >> idx >> f >> th >> l >> r) || idx != i) return false;
            ForestNode nd{f, th, l, r, l<0 && r<0, {}};
            for(std::size_t c=0;c<C;++c){
                double p;
                if(!(in >> p) || !std::isfinite(p) || p < 0) return false;
                nd.p.push_back(p);
            }
            // children always follow their parent, so traversal terminates
            if(!nd.leaf && (f < 0 || static_cast<std::size_t>(f) >= F || l <= i || r <= i || l >= N || r >= N)) return false;
            tr.n.push_back(std::move(nd));
        }
        loaded.push_back(std::move(tr));
    }
    trees = std::move(loaded);
    classes = C; features = F; importance = std::move(imp);
    return true;
}

void Forest::save(std::ostream& out) const{
    out.precision(17);
    out << "forest " << trees.size() << " " << classes << " " << features << "\n";
    if(!importance.empty()){
        out << "importance";
        for(double v : importance) out << " " << v;
        out << "\n";
    }
    for(const auto& t : trees){
        out << "tree " << t.n.size() << "\n";
        for(std::size_t i=0;i<t.n.size();++i){
            const auto& nd = t.n[i];
            out << i << " " << nd.f << " " << nd.t << " " << nd.l << " " << nd.r;
            for(double p : nd.p) out << " " << p;
            out << "\n";
        }
    }
}

}  // namespace CropAdvisor
