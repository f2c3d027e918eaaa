/*
 * Copyright (c) 2026
 *
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * ZCR: Zone-based Clustering and Relaying for wireless sensor networks
 * K-Means implementation.
 */

#include "zcr-kmeans.h"

#include "ns3/assert.h"
#include "ns3/log.h"

#include <algorithm>
#include <limits>
#include <numeric>

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("ZcrKMeans");

namespace zcr
{

const uint32_t KMeans::MAX_ITERATIONS = 100;
const double KMeans::CONVERGENCE_EPSILON = 1e-4;

KMeans::KMeans(uint32_t nClusters, Ptr<UniformRandomVariable> rng)
    : m_nClusters(nClusters),
      m_rng(rng),
      m_iterations(0)
{
    NS_LOG_FUNCTION(this << nClusters);
    NS_ASSERT_MSG(m_rng, "KMeans needs a random stream");
}

void
KMeans::Fit(const std::vector<Vector2D>& points)
{
    NS_LOG_FUNCTION(this << points.size());
    NS_ASSERT_MSG(m_nClusters > 0 && m_nClusters <= points.size(),
                  "Cannot fit " << m_nClusters << " clusters to " << points.size()
                                << " points");

    SampleCentroids(points);
    m_assignments.assign(points.size(), 0);
    m_iterations = 0;

    while (m_iterations < MAX_ITERATIONS)
    {
        ++m_iterations;
        AssignPoints(points);
        double shift = UpdateCentroids(points);
        if (shift < CONVERGENCE_EPSILON)
        {
            break;
        }
    }
    NS_LOG_DEBUG("K-Means k=" << m_nClusters << " over " << points.size() << " points finished after "
                              << m_iterations << " iterations");
}

void
KMeans::SampleCentroids(const std::vector<Vector2D>& points)
{
    // Partial Fisher-Yates shuffle: the first k indices form the sample.
    std::vector<uint32_t> index(points.size());
    std::iota(index.begin(), index.end(), 0);
    uint32_t last = static_cast<uint32_t>(points.size()) - 1;
    for (uint32_t i = 0; i < m_nClusters; ++i)
    {
        uint32_t j = m_rng->GetInteger(i, last);
        std::swap(index[i], index[j]);
    }

    m_centroids.clear();
    for (uint32_t i = 0; i < m_nClusters; ++i)
    {
        m_centroids.push_back(points[index[i]]);
        NS_LOG_LOGIC("Seed centroid " << i << " at point " << index[i]);
    }
}

void
KMeans::AssignPoints(const std::vector<Vector2D>& points)
{
    for (uint32_t i = 0; i < points.size(); ++i)
    {
        double minDistance = std::numeric_limits<double>::infinity();
        for (uint32_t c = 0; c < m_nClusters; ++c)
        {
            double d = CalculateDistance(points[i], m_centroids[c]);
            if (d < minDistance)
            {
                minDistance = d;
                m_assignments[i] = c;
            }
        }
    }
}

double
KMeans::UpdateCentroids(const std::vector<Vector2D>& points)
{
    std::vector<Vector2D> sums(m_nClusters, Vector2D(0.0, 0.0));
    std::vector<uint32_t> counts(m_nClusters, 0);
    for (uint32_t i = 0; i < points.size(); ++i)
    {
        uint32_t c = m_assignments[i];
        sums[c].x += points[i].x;
        sums[c].y += points[i].y;
        ++counts[c];
    }

    double maxShift = 0.0;
    for (uint32_t c = 0; c < m_nClusters; ++c)
    {
        if (counts[c] == 0)
        {
            NS_LOG_LOGIC("Cluster " << c << " is empty, centroid unchanged");
            continue;
        }
        Vector2D mean(sums[c].x / counts[c], sums[c].y / counts[c]);
        maxShift = std::max(maxShift, CalculateDistance(mean, m_centroids[c]));
        m_centroids[c] = mean;
    }
    return maxShift;
}

uint32_t
KMeans::GetNClusters() const
{
    return m_nClusters;
}

const std::vector<Vector2D>&
KMeans::GetCentroids() const
{
    return m_centroids;
}

const std::vector<uint32_t>&
KMeans::GetAssignments() const
{
    return m_assignments;
}

uint32_t
KMeans::GetIterations() const
{
    return m_iterations;
}

} // namespace zcr
} // namespace ns3
