/*
 * Copyright (c) 2026
 *
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * ZCR: Zone-based Clustering and Relaying for wireless sensor networks
 * Common interface of the round-based clustering protocols.
 */

#ifndef ZCR_CLUSTERING_PROTOCOL_H
#define ZCR_CLUSTERING_PROTOCOL_H

#include "zcr-radio-energy-model.h"
#include "zcr-sensor-network.h"

#include "ns3/object.h"
#include "ns3/traced-callback.h"

#include <string>

namespace ns3
{
namespace zcr
{

/**
 * @ingroup zcr
 * @brief Base class of the clustering protocols driven by SensorNetwork::Advance().
 *
 * A protocol executes one complete round at a time: it picks cluster heads,
 * forms clusters and charges every node the radio energy it spent.  Two
 * implementations exist, LeachProtocol (probabilistic rotation election) and
 * ZoneClusteringProtocol (K-Means clusters with near/far zone relaying).
 *
 * The parameters shared by both protocols are registered here as ns-3
 * Attributes: cluster head probability, packet size and the radio model
 * constants.
 */
class ClusteringProtocol : public Object
{
  public:
    /**
     * @brief Get the type ID.
     * @return the object TypeId
     */
    static TypeId GetTypeId();

    ClusteringProtocol();
    ~ClusteringProtocol() override;

    /**
     * TracedCallback signature for the per-round cluster head count.
     *
     * @param [in] round the round just executed
     * @param [in] clusterHeads number of cluster heads selected in that round
     */
    typedef void (*ClusterHeadElectionTracedCallback)(uint32_t round, uint32_t clusterHeads);

    /**
     * @brief Execute one round on the network.
     *
     * Called by SensorNetwork::Advance() after the round counter was
     * incremented.  The round either completes fully or, in documented
     * degenerate cases, leaves the network untouched.
     *
     * @param network the network to operate on
     */
    virtual void RunRound(SensorNetwork& network) = 0;

    /// @returns a short protocol name for logs and reports
    virtual std::string GetName() const = 0;

    /**
     * Assign a fixed random variable stream number to the random variables
     * used by this protocol.
     *
     * @param stream first stream index to use
     * @return the number of stream indices assigned by this protocol
     */
    virtual int64_t AssignStreams(int64_t stream) = 0;

    /**
     * @brief Check a cluster head probability without applying it.
     *
     * @param probability the candidate value
     * @param [out] reason set to a description of the problem, if any
     * @returns true if probability lies in (0, 1]
     */
    static bool CheckProbability(double probability, std::string& reason);

    /**
     * @param probability desired fraction of cluster heads per round, in (0, 1]
     */
    void SetClusterHeadProbability(double probability);
    /// @returns the desired fraction of cluster heads per round
    double GetClusterHeadProbability() const;
    /// @returns the data packet size (bits)
    uint32_t GetPacketSize() const;
    /// @returns a radio model built from the current attribute values
    RadioEnergyModel GetRadioEnergyModel() const;

  protected:
    /**
     * @brief Attach a member to a cluster head and charge its data transmission.
     *
     * The member spends TransmitEnergy(packet, distance to CH), records the
     * CH id and is appended to the CH's member list.
     *
     * @param network the network
     * @param memberId member node id
     * @param headId cluster head node id
     * @param radio radio model in use this round
     */
    void JoinClusterHead(SensorNetwork& network,
                         uint32_t memberId,
                         uint32_t headId,
                         const RadioEnergyModel& radio) const;

    /**
     * @brief Charge a cluster head for receiving and aggregating its members' packets.
     *
     * @param head the cluster head
     * @param radio radio model in use this round
     */
    void ChargeAggregation(SensorNode& head, const RadioEnergyModel& radio) const;

    /**
     * @brief Charge a node for one packet sent over a distance.
     *
     * @param node the sender
     * @param distance distance to the receiver (m)
     * @param radio radio model in use this round
     */
    void ChargeTransmission(SensorNode& node, double distance, const RadioEnergyModel& radio) const;

    /// Fired once per executed round with the number of cluster heads.
    TracedCallback<uint32_t, uint32_t> m_clusterHeadTrace;

  private:
    double m_clusterHeadProbability; ///< Desired CH fraction p
    uint32_t m_packetSize;           ///< Data packet size (bits)
    double m_electronicsEnergy;      ///< E_elec (J/bit)
    double m_freeSpaceEnergy;        ///< E_fs (J/bit/m^2)
    double m_multipathEnergy;        ///< E_mp (J/bit/m^4)
    double m_aggregationEnergy;      ///< E_agg (J/bit)
    double m_thresholdDistance;      ///< d0 (m), 0 to derive
};

} // namespace zcr
} // namespace ns3

#endif /* ZCR_CLUSTERING_PROTOCOL_H */
