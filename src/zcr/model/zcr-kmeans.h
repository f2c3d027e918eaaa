/*
 * Copyright (c) 2026
 *
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * ZCR: Zone-based Clustering and Relaying for wireless sensor networks
 * K-Means spatial clustering of node positions.
 */

#ifndef ZCR_KMEANS_H
#define ZCR_KMEANS_H

#include "ns3/ptr.h"
#include "ns3/random-variable-stream.h"
#include "ns3/vector.h"

#include <cstdint>
#include <vector>

namespace ns3
{
namespace zcr
{

/**
 * @ingroup zcr
 * @brief Lloyd's K-Means over 2D positions.
 *
 * Fit() seeds k centroids by sampling k distinct input points uniformly
 * without replacement, then alternates an assignment step (nearest centroid,
 * lowest index on ties) and an update step (mean of the assigned points) until
 * no centroid moves by CONVERGENCE_EPSILON or more, or MAX_ITERATIONS is
 * reached.  A centroid that loses all its points keeps its position.
 *
 * Nothing is carried over between calls to Fit().  All random draws come from
 * the injected stream, so a fixed stream number gives repeatable results.
 */
class KMeans
{
  public:
    /// Upper bound on Lloyd iterations per Fit().
    static const uint32_t MAX_ITERATIONS;
    /// Largest centroid displacement (m) still considered converged.
    static const double CONVERGENCE_EPSILON;

    /**
     * @param nClusters number of clusters k
     * @param rng       random stream used to sample the initial centroids
     */
    KMeans(uint32_t nClusters, Ptr<UniformRandomVariable> rng);

    /**
     * @brief Partition the points into k clusters.
     *
     * The caller must clamp k to the number of points beforehand.
     *
     * @param points positions to cluster; must hold at least k entries
     */
    void Fit(const std::vector<Vector2D>& points);

    /// @returns k
    uint32_t GetNClusters() const;
    /// @returns the centroid of each cluster after the last Fit()
    const std::vector<Vector2D>& GetCentroids() const;
    /// @returns the cluster index of each point, parallel to the Fit() input
    const std::vector<uint32_t>& GetAssignments() const;
    /// @returns the number of Lloyd iterations executed by the last Fit()
    uint32_t GetIterations() const;

  private:
    /**
     * Seed the centroids with k distinct points chosen uniformly at random.
     * @param points the Fit() input
     */
    void SampleCentroids(const std::vector<Vector2D>& points);
    /**
     * Assign every point to its nearest centroid.
     * @param points the Fit() input
     */
    void AssignPoints(const std::vector<Vector2D>& points);
    /**
     * Move every non-empty cluster's centroid to the mean of its points.
     * @param points the Fit() input
     * @returns the largest centroid displacement
     */
    double UpdateCentroids(const std::vector<Vector2D>& points);

    uint32_t m_nClusters;                  ///< k
    Ptr<UniformRandomVariable> m_rng;      ///< Centroid sampling stream
    std::vector<Vector2D> m_centroids;     ///< Current centroids
    std::vector<uint32_t> m_assignments;   ///< Cluster index per point
    uint32_t m_iterations;                 ///< Iterations of the last Fit()
};

} // namespace zcr
} // namespace ns3

#endif /* ZCR_KMEANS_H */
