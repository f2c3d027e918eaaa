/*
 * Copyright (c) 2026
 *
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * ZCR: Zone-based Clustering and Relaying for wireless sensor networks
 * Sensor network state and the round-stepped simulation driver.
 */

#ifndef ZCR_SENSOR_NETWORK_H
#define ZCR_SENSOR_NETWORK_H

#include "zcr-sensor-node.h"

#include "ns3/ptr.h"
#include "ns3/random-variable-stream.h"
#include "ns3/traced-callback.h"
#include "ns3/vector.h"

#include <string>
#include <vector>

namespace ns3
{
namespace zcr
{

class ClusteringProtocol;

/**
 * @ingroup zcr
 * @brief The simulated sensor field and its round counter.
 *
 * SensorNetwork exclusively owns the node list, the current round and the
 * alive node count.  Advance() moves the simulation forward by exactly one
 * round: it increments the round counter and hands the whole network to the
 * protocol, which mutates node energy and roles in place.  Deciding when to
 * stop (no alive node left, round cap) is up to the caller.
 *
 * Like the rest of the model the network is passive and single-threaded; it
 * never schedules events.  External observers (CSV writers, statistics)
 * connect to m_energyRecordTrace, which fires once per node after every
 * round.
 *
 * The alive count is a cache of the number of nodes with isAlive set.  Every
 * transition to dead goes through MarkDead() so the two never drift apart.
 */
class SensorNetwork
{
  public:
    /// Default deployment area width (m).
    static const double DEFAULT_AREA_WIDTH;
    /// Default deployment area height (m).
    static const double DEFAULT_AREA_HEIGHT;
    /// Default number of sensors placed by Deploy().
    static const uint32_t DEFAULT_NODE_COUNT;
    /// Default initial node energy (J).
    static const double DEFAULT_INITIAL_ENERGY;

    /**
     * @brief Construct an empty network with the sink at the centre of the area.
     *
     * @param width         area width (m), must be positive
     * @param height        area height (m), must be positive
     * @param initialEnergy energy given to every new node (J), must be positive
     */
    SensorNetwork(double width, double height, double initialEnergy);

    /**
     * @brief Construct an empty network with an explicit sink position.
     *
     * @param width         area width (m), must be positive
     * @param height        area height (m), must be positive
     * @param initialEnergy energy given to every new node (J), must be positive
     * @param baseStation   sink position
     */
    SensorNetwork(double width, double height, double initialEnergy, const Vector2D& baseStation);

    /**
     * @brief Validate network parameters without constructing anything.
     *
     * @param width         area width (m)
     * @param height        area height (m)
     * @param nodeCount     number of nodes to deploy
     * @param initialEnergy initial node energy (J)
     * @param [out] reason  set to a description of the first problem found
     * @returns true if all parameters are acceptable
     */
    static bool CheckParameters(double width,
                                double height,
                                uint32_t nodeCount,
                                double initialEnergy,
                                std::string& reason);

    /**
     * @brief Place nodeCount new nodes uniformly in [1, width) x [1, height).
     * @param nodeCount number of nodes to add, must be positive
     */
    void Deploy(uint32_t nodeCount);

    /**
     * @brief Append one node at a given position.
     * @param position node position (m)
     * @returns the id of the new node
     */
    uint32_t AddNode(const Vector2D& position);

    /**
     * Assign a fixed random variable stream number to the random variables
     * used by this network (node placement).
     *
     * @param stream first stream index to use
     * @return the number of stream indices assigned
     */
    int64_t AssignStreams(int64_t stream);

    /**
     * @brief Run one round of the given protocol.
     *
     * Increments the round counter, lets the protocol execute the round and
     * then emits one EnergyRecord per node through m_energyRecordTrace.
     *
     * @param protocol the protocol driving this round
     * @returns the round number just executed (first round is 1)
     */
    uint32_t Advance(Ptr<ClusteringProtocol> protocol);

    /**
     * @brief Flag a node dead and update the alive count.
     *
     * Does nothing if the node is already dead.
     *
     * @param id node id
     */
    void MarkDead(uint32_t id);

    /// @returns mutable access to the node list, indexed by node id
    std::vector<SensorNode>& GetNodes();
    /// @returns the node list, indexed by node id
    const std::vector<SensorNode>& GetNodes() const;
    /**
     * @param id node id
     * @returns the node with that id
     */
    SensorNode& GetNode(uint32_t id);
    /**
     * @param id node id
     * @returns the node with that id
     */
    const SensorNode& GetNode(uint32_t id) const;
    /// @returns the number of nodes ever placed (alive or dead)
    uint32_t GetNNodes() const;
    /// @returns the last executed round (0 before the first Advance())
    uint32_t GetCurrentRound() const;
    /// @returns the cached alive node count
    uint32_t GetAliveNodeCount() const;
    /// @returns the number of nodes with isAlive set, recounted from the node list
    uint32_t CountAliveNodes() const;

    /// @returns the area width (m)
    double GetAreaWidth() const;
    /// @returns the area height (m)
    double GetAreaHeight() const;
    /// @returns sqrt(width^2 + height^2), the largest distance inside the area
    double GetAreaDiagonal() const;
    /// @returns the energy every node starts with (J)
    double GetInitialEnergy() const;
    /// @returns the sink position
    Vector2D GetBaseStation() const;

    /// @returns the sum of the residual energy of alive nodes (J)
    double GetTotalRemainingEnergy() const;
    /// @returns the mean residual energy of alive nodes, 0 if none is alive (J)
    double GetAverageRemainingEnergy() const;

    /// @returns one record per node for the current round, in id order
    std::vector<EnergyRecord> GetEnergyRecords() const;
    /// @returns positions and flags of every node, in id order
    std::vector<NodeSnapshot> GetSnapshot() const;

    /// Fired after every round, once per node in id order.
    TracedCallback<const EnergyRecord&> m_energyRecordTrace;

  private:
    std::vector<SensorNode> m_nodes;        ///< Node arena, index == id
    uint32_t m_currentRound;                ///< Rounds executed so far
    uint32_t m_aliveNodeCount;              ///< Cached count of alive nodes
    double m_width;                         ///< Area width (m)
    double m_height;                        ///< Area height (m)
    double m_initialEnergy;                 ///< Initial node energy (J)
    Vector2D m_baseStation;                 ///< Sink position
    Ptr<UniformRandomVariable> m_positionRng; ///< Node placement stream
};

} // namespace zcr
} // namespace ns3

#endif /* ZCR_SENSOR_NETWORK_H */
