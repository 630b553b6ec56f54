/**
 * @file ConnectedComponent.cpp
 * @brief Two-pass union-find labelling and label bookkeeping
 */

#include <CellDeclump/Internal/ConnectedComponent.h>
#include <CellDeclump/Internal/Neighborhood.h>
#include <CellDeclump/Core/Validate.h>

#include <algorithm>
#include <map>

namespace Cell::Declump::Internal {

// =============================================================================
// Union-Find Data Structure
// =============================================================================

namespace {

class UnionFind {
public:
    UnionFind() = default;

    int32_t Add() {
        int32_t id = static_cast<int32_t>(parent_.size());
        parent_.push_back(id);
        rank_.push_back(0);
        return id;
    }

    int32_t Find(int32_t x) {
        // Path halving
        while (parent_[x] != x) {
            parent_[x] = parent_[parent_[x]];
            x = parent_[x];
        }
        return x;
    }

    void Union(int32_t x, int32_t y) {
        int32_t px = Find(x);
        int32_t py = Find(y);
        if (px == py) return;

        // Union by rank
        if (rank_[px] < rank_[py]) {
            parent_[px] = py;
        } else if (rank_[px] > rank_[py]) {
            parent_[py] = px;
        } else {
            parent_[py] = px;
            rank_[px]++;
        }
    }

private:
    std::vector<int32_t> parent_;
    std::vector<int32_t> rank_;
};

} // anonymous namespace

// =============================================================================
// Connected Component Labeling
// =============================================================================

LabelImage LabelConnectedComponents(const QVolume<uint8_t>& binary,
                                    int32_t connectivity,
                                    int32_t& numLabels) {
    numLabels = 0;
    if (binary.Empty()) return LabelImage();

    Validate::RequireConnectivity(connectivity, binary.NDim(), "LabelConnectedComponents");
    std::vector<Point3i> preceding = PrecedingNeighborOffsets(binary.NDim(), connectivity);

    // First pass: provisional labels (1-based; 0 in union-find is unused)
    std::vector<int32_t> provisional(binary.NumVoxels(), 0);
    UnionFind uf;
    uf.Add();

    for (size_t idx = 0; idx < binary.NumVoxels(); ++idx) {
        if (binary[idx] == 0) continue;  // Background

        int32_t current = 0;
        ForEachNeighbor(binary, idx, preceding, [&](size_t n) {
            int32_t lbl = provisional[n];
            if (lbl == 0) return;
            if (current == 0) {
                current = lbl;
            } else if (lbl != current) {
                uf.Union(current, lbl);
            }
        });

        provisional[idx] = current != 0 ? current : uf.Add();
    }

    // Second pass: resolve roots in raster order
    std::map<int32_t, int32_t> remap;
    LabelImage labels = LabelImage::Like(binary);
    for (size_t idx = 0; idx < provisional.size(); ++idx) {
        if (provisional[idx] == 0) continue;
        int32_t root = uf.Find(provisional[idx]);
        auto it = remap.find(root);
        if (it == remap.end()) {
            it = remap.emplace(root, ++numLabels).first;
        }
        labels[idx] = it->second;
    }
    return labels;
}

LabelImage LabelConnectedComponents(const QVolume<uint8_t>& binary, int32_t& numLabels) {
    return LabelConnectedComponents(binary, 1, numLabels);
}

// =============================================================================
// Label Bookkeeping
// =============================================================================

LabelImage RelabelSequential(const LabelImage& labels, int32_t& numLabels) {
    numLabels = 0;
    if (labels.Empty()) return LabelImage();

    std::vector<int32_t> distinct;
    distinct.reserve(64);
    for (int32_t v : labels.Values()) {
        if (v != BACKGROUND_LABEL) distinct.push_back(v);
    }
    std::sort(distinct.begin(), distinct.end());
    distinct.erase(std::unique(distinct.begin(), distinct.end()), distinct.end());
    numLabels = static_cast<int32_t>(distinct.size());

    LabelImage result = LabelImage::Like(labels);
    for (size_t i = 0; i < labels.NumVoxels(); ++i) {
        int32_t v = labels[i];
        if (v == BACKGROUND_LABEL) continue;
        auto it = std::lower_bound(distinct.begin(), distinct.end(), v);
        result[i] = static_cast<int32_t>(it - distinct.begin()) + 1;
    }
    return result;
}

std::vector<int64_t> LabelHistogram(const LabelImage& labels) {
    if (labels.Empty()) return {0};

    if (labels.Min() < 0) {
        throw InvalidArgumentException("LabelHistogram: labels must be non-negative");
    }

    std::vector<int64_t> counts(static_cast<size_t>(labels.Max()) + 1, 0);
    for (int32_t v : labels.Values()) {
        counts[v]++;
    }
    return counts;
}

} // namespace Cell::Declump::Internal
