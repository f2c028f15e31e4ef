#include "core/PathSolver.h"
#include "core/Logger.h"

#include <cstdint>
#include <limits>

namespace harmonicflow {

// ═══════════════════════════════════════════════════════════════════
// DistanceMatrix
// ═══════════════════════════════════════════════════════════════════

DistanceMatrix::DistanceMatrix(const std::vector<CamelotKey>& keys)
    : keys_(keys)
{
    int n = static_cast<int>(keys_.size());
    costs_.assign(static_cast<size_t>(n) * static_cast<size_t>(n), 0);
    for (int i = 0; i < n; ++i)
    {
        for (int j = i + 1; j < n; ++j)
        {
            int d = keyDistance(keys_[static_cast<size_t>(i)], keys_[static_cast<size_t>(j)]);
            costs_[static_cast<size_t>(i * n + j)] = d;
            costs_[static_cast<size_t>(j * n + i)] = d;
        }
    }
}

int DistanceMatrix::size() const
{
    return static_cast<int>(keys_.size());
}

int DistanceMatrix::at(int from, int to) const
{
    return costs_[static_cast<size_t>(from * size() + to)];
}

const CamelotKey& DistanceMatrix::key(int index) const
{
    return keys_[static_cast<size_t>(index)];
}

// ═══════════════════════════════════════════════════════════════════
// PathSolver
// ═══════════════════════════════════════════════════════════════════

PathSolver::PathSolver(int exactLimit)
    : exactLimit_(exactLimit)
{
    // Above the upper bound the subset table no longer fits comfortably in memory.
    if (exactLimit_ < kMinExactLimit) exactLimit_ = kMinExactLimit;
    if (exactLimit_ > kMaxExactLimit) exactLimit_ = kMaxExactLimit;
}

int PathSolver::getExactLimit() const
{
    return exactLimit_;
}

std::vector<CamelotKey> PathSolver::solve(const std::vector<CamelotKey>& keys) const
{
    DistanceMatrix matrix(keys);
    auto order = solveIndices(matrix);

    std::vector<CamelotKey> path;
    path.reserve(order.size());
    for (int index : order)
        path.push_back(matrix.key(index));
    return path;
}

std::vector<int> PathSolver::solveIndices(const DistanceMatrix& matrix) const
{
    int n = matrix.size();
    if (n <= 2)
    {
        std::vector<int> order;
        for (int i = 0; i < n; ++i)
            order.push_back(i);
        return order;
    }

    if (n <= exactLimit_)
    {
        HF_DEBUG("PathSolver: exact solve over %d keys", n);
        return solveExact(matrix);
    }

    HF_DEBUG("PathSolver: %d keys exceeds exact limit %d, using greedy", n, exactLimit_);
    return solveGreedy(matrix);
}

std::vector<int> PathSolver::solveExact(const DistanceMatrix& matrix)
{
    // best[mask][end] = min cost of a path visiting exactly mask, ending at end.
    // Costs stay small (at most (n-1) * kMaxKeyDistance), so 16 bits suffice.
    using Cost = std::uint16_t;
    constexpr Cost kUnreached = std::numeric_limits<Cost>::max();

    const int n = matrix.size();
    if (n == 0)
        return {};

    const size_t numMasks = size_t{1} << n;
    const size_t stride = static_cast<size_t>(n);
    std::vector<Cost> best(numMasks * stride, kUnreached);
    std::vector<std::int8_t> prev(numMasks * stride, -1);

    for (int i = 0; i < n; ++i)
        best[(size_t{1} << i) * stride + static_cast<size_t>(i)] = 0;

    for (size_t mask = 1; mask < numMasks; ++mask)
    {
        for (int end = 0; end < n; ++end)
        {
            if (!(mask & (size_t{1} << end)))
                continue;
            Cost cost = best[mask * stride + static_cast<size_t>(end)];
            if (cost == kUnreached)
                continue;

            for (int next = 0; next < n; ++next)
            {
                if (mask & (size_t{1} << next))
                    continue;
                size_t nextMask = mask | (size_t{1} << next);
                size_t slot = nextMask * stride + static_cast<size_t>(next);
                Cost candidate = static_cast<Cost>(cost + matrix.at(end, next));
                if (candidate < best[slot])
                {
                    best[slot] = candidate;
                    prev[slot] = static_cast<std::int8_t>(end);
                }
            }
        }
    }

    // Lowest index wins among equal-cost endpoints.
    const size_t full = numMasks - 1;
    int bestEnd = 0;
    for (int end = 1; end < n; ++end)
    {
        if (best[full * stride + static_cast<size_t>(end)] <
            best[full * stride + static_cast<size_t>(bestEnd)])
            bestEnd = end;
    }

    std::vector<int> order(static_cast<size_t>(n));
    size_t mask = full;
    int current = bestEnd;
    for (int pos = n - 1; pos >= 0; --pos)
    {
        order[static_cast<size_t>(pos)] = current;
        int before = prev[mask * stride + static_cast<size_t>(current)];
        mask &= ~(size_t{1} << current);
        current = before;
    }

    HF_TRACE("PathSolver::solveExact: n=%d cost=%d",
             n, static_cast<int>(best[full * stride + static_cast<size_t>(bestEnd)]));
    return order;
}

std::vector<int> PathSolver::solveGreedy(const DistanceMatrix& matrix)
{
    const int n = matrix.size();
    std::vector<int> order;
    if (n == 0)
        return order;

    std::vector<bool> visited(static_cast<size_t>(n), false);
    order.reserve(static_cast<size_t>(n));
    order.push_back(0);
    visited[0] = true;

    while (static_cast<int>(order.size()) < n)
    {
        int current = order.back();
        int bestNext = -1;
        for (int candidate = 0; candidate < n; ++candidate)
        {
            if (visited[static_cast<size_t>(candidate)])
                continue;
            if (bestNext < 0 || matrix.at(current, candidate) < matrix.at(current, bestNext))
                bestNext = candidate;
        }
        visited[static_cast<size_t>(bestNext)] = true;
        order.push_back(bestNext);
    }

    return order;
}

int PathSolver::pathCost(const DistanceMatrix& matrix, const std::vector<int>& order)
{
    int total = 0;
    for (size_t i = 1; i < order.size(); ++i)
        total += matrix.at(order[i - 1], order[i]);
    return total;
}

} // namespace harmonicflow
