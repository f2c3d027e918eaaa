/*
 * Copyright (c) 2026
 *
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * ZCR: Zone-based Clustering and Relaying for wireless sensor networks
 * Per-sensor state and the per-round records derived from it.
 */

#ifndef ZCR_SENSOR_NODE_H
#define ZCR_SENSOR_NODE_H

#include "ns3/vector.h"

#include <cstdint>
#include <limits>
#include <ostream>
#include <vector>

namespace ns3
{
namespace zcr
{

/// Value of SensorNode::clusterHeadId when the node has no cluster head this round.
static const uint32_t NO_CLUSTER_HEAD = std::numeric_limits<uint32_t>::max();

/**
 * @ingroup zcr
 * @brief State of a single sensor node.
 *
 * A SensorNode only holds state; every protocol decision is taken by a
 * ClusteringProtocol operating on the SensorNetwork that owns the node.
 * Nodes are stored in an append-only vector and addressed by id, which is
 * also their index, so clusterHeadId and clusterMemberIds stay valid across
 * rounds.  Dead nodes stay in the vector with isAlive cleared.
 */
struct SensorNode
{
    uint32_t id;                   ///< Stable identifier, equal to the index in the network
    Vector2D position;             ///< Location in the deployment area (m), fixed at creation
    double remainingEnergy;        ///< Residual energy (J); only ever decreases
    bool isAlive;                  ///< Cleared once the node runs out of energy, never set again
    bool isClusterHead;            ///< Cluster head in the current round
    bool isEligibleForClusterHead; ///< LEACH rotation flag
    double distanceToBaseStation;  ///< Euclidean distance to the sink (m), fixed at creation
    uint32_t clusterHeadId;        ///< CH this node reports to, or NO_CLUSTER_HEAD
    std::vector<uint32_t> clusterMemberIds; ///< Members; non-empty only on a CH

    /**
     * @brief Construct a fresh, alive node.
     *
     * @param nodeId        stable node id
     * @param pos           position in the deployment area
     * @param energy        initial energy (J)
     * @param baseStation   sink position, used to precompute distanceToBaseStation
     */
    SensorNode(uint32_t nodeId, const Vector2D& pos, double energy, const Vector2D& baseStation)
        : id(nodeId),
          position(pos),
          remainingEnergy(energy),
          isAlive(true),
          isClusterHead(false),
          isEligibleForClusterHead(true),
          distanceToBaseStation(CalculateDistance(pos, baseStation)),
          clusterHeadId(NO_CLUSTER_HEAD)
    {
    }

    /// @returns true if the node is assigned to a cluster head this round
    bool HasClusterHead() const
    {
        return clusterHeadId != NO_CLUSTER_HEAD;
    }

    /// Clear the per-round role: CH flag, CH back-reference and member list.
    void ResetRound()
    {
        isClusterHead = false;
        clusterHeadId = NO_CLUSTER_HEAD;
        clusterMemberIds.clear();
    }
};

/**
 * @ingroup zcr
 * @brief One line of the per-round metrics stream.
 *
 * The field order is the CSV column order and must not change:
 * round,alive_nodes,node_id,remaining_energy_j
 */
struct EnergyRecord
{
    uint32_t round;         ///< Round the record was taken after
    uint32_t aliveNodes;    ///< Alive node count after the round
    uint32_t nodeId;        ///< Node the energy belongs to
    double remainingEnergy; ///< Residual energy of the node (J)
};

/**
 * @brief Write a record as one CSV line (without newline).
 * @param os the output stream
 * @param record the record
 * @returns the output stream
 */
std::ostream& operator<<(std::ostream& os, const EnergyRecord& record);

/**
 * @ingroup zcr
 * @brief Read-only view of a node for visualization.
 */
struct NodeSnapshot
{
    uint32_t id;        ///< Node id
    Vector2D position;  ///< Node position (m)
    bool isAlive;       ///< Alive flag
    bool isClusterHead; ///< CH flag for the last executed round
};

} // namespace zcr
} // namespace ns3

#endif /* ZCR_SENSOR_NODE_H */
