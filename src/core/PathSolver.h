#pragma once

#include "core/CamelotKey.h"

#include <vector>

namespace harmonicflow {

/// Symmetric transition costs between the keys present in one run.
class DistanceMatrix {
public:
    explicit DistanceMatrix(const std::vector<CamelotKey>& keys);

    int size() const;
    int at(int from, int to) const;
    const CamelotKey& key(int index) const;

private:
    std::vector<CamelotKey> keys_;
    std::vector<int> costs_;
};

/// Orders distinct keys to minimise the summed transition distance
/// (shortest open Hamiltonian path).
///
/// Up to exactLimit keys are solved exactly by dynamic programming over
/// subsets; larger sets use nearest-unvisited-neighbour construction from the
/// first key. Output is deterministic for a given input order.
class PathSolver {
public:
    static constexpr int kDefaultExactLimit = 20;
    static constexpr int kMinExactLimit = 3;
    static constexpr int kMaxExactLimit = 20;

    explicit PathSolver(int exactLimit = kDefaultExactLimit);

    int getExactLimit() const;

    /// Returns the keys in visiting order, each exactly once.
    std::vector<CamelotKey> solve(const std::vector<CamelotKey>& keys) const;

    /// Returns indices into matrix in visiting order.
    std::vector<int> solveIndices(const DistanceMatrix& matrix) const;

    static std::vector<int> solveExact(const DistanceMatrix& matrix);
    static std::vector<int> solveGreedy(const DistanceMatrix& matrix);

    /// Sum of consecutive distances along order.
    static int pathCost(const DistanceMatrix& matrix, const std::vector<int>& order);

private:
    int exactLimit_;
};

} // namespace harmonicflow
