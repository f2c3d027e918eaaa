/*
 * Copyright (c) 2026
 *
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * ZCR: Zone-based Clustering and Relaying for wireless sensor networks
 * Zone-based clustering protocol with near-zone relaying.
 */

#ifndef ZCR_ZONE_CLUSTERING_PROTOCOL_H
#define ZCR_ZONE_CLUSTERING_PROTOCOL_H

#include "zcr-clustering-protocol.h"

#include "ns3/random-variable-stream.h"

#include <vector>

namespace ns3
{
namespace zcr
{

/**
 * @ingroup zcr
 * @brief ZCR: zone-based spatial clustering with relaying through near-zone heads.
 *
 * Each round:
 *  1. k = ceil(p * alive nodes) clusters are formed with K-Means over the
 *     positions of the nodes that still have energy.
 *  2. In every cluster the node with the highest score
 *     (remaining / initial energy) - (distance to centroid / area diagonal)
 *     becomes cluster head.  Ties keep the lowest node id.
 *  3. Heads within the free-space threshold of the sink form the near zone,
 *     the others the far zone.
 *  4. Members send to the head of their own cluster.
 *  5. Near heads aggregate and send straight to the sink.  Far heads aggregate
 *     and relay through the closest near head when that hop is strictly
 *     shorter than the direct path, otherwise they send directly.  A relaying
 *     near head pays receive + aggregation for the extra packet.
 *
 * A round with no alive node is a no-op.
 */
class ZoneClusteringProtocol : public ClusteringProtocol
{
  public:
    /**
     * @brief Get the type ID.
     * @return the object TypeId
     */
    static TypeId GetTypeId();

    ZoneClusteringProtocol();
    ~ZoneClusteringProtocol() override;

    void RunRound(SensorNetwork& network) override;
    std::string GetName() const override;
    int64_t AssignStreams(int64_t stream) override;

    /**
     * @param aliveNodes number of alive nodes
     * @returns ceil(p * aliveNodes)
     */
    uint32_t ComputeDesiredClusterCount(uint32_t aliveNodes) const;

    /// @returns k computed for the last executed round, before clamping
    uint32_t GetDesiredClusterCount() const;
    /// @returns the near-zone cluster heads of the last executed round
    const std::vector<uint32_t>& GetNearZoneClusterHeads() const;
    /// @returns the far-zone cluster heads of the last executed round
    const std::vector<uint32_t>& GetFarZoneClusterHeads() const;
    /// @returns the number of far heads that relayed in the last executed round
    uint32_t GetRelayCount() const;

  protected:
    void DoDispose() override;

  private:
    /**
     * Pick the best scoring alive node of every cluster.
     * @param network the network
     * @param candidates node id of every clustered point
     * @param assignments cluster of every clustered point
     * @param centroids cluster centroids
     * @returns the head of every cluster, or NO_CLUSTER_HEAD for an empty one
     */
    std::vector<uint32_t> SelectClusterHeads(const SensorNetwork& network,
                                             const std::vector<uint32_t>& candidates,
                                             const std::vector<uint32_t>& assignments,
                                             const std::vector<Vector2D>& centroids) const;

    /**
     * Charge the far-zone heads for aggregation and the uplink, relaying where shorter.
     * @param network the network
     * @param radio radio model for this round
     */
    void DissipateFarZone(SensorNetwork& network, const RadioEnergyModel& radio);

    uint32_t m_desiredClusters;           ///< k of the last round
    std::vector<uint32_t> m_nearHeads;    ///< Near-zone CH ids
    std::vector<uint32_t> m_farHeads;     ///< Far-zone CH ids
    uint32_t m_relayCount;                ///< Relayed uplinks in the last round
    Ptr<UniformRandomVariable> m_clusteringRng; ///< K-Means seeding stream
};

} // namespace zcr
} // namespace ns3

#endif /* ZCR_ZONE_CLUSTERING_PROTOCOL_H */
