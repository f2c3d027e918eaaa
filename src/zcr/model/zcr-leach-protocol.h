/*
 * Copyright (c) 2026
 *
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * ZCR: Zone-based Clustering and Relaying for wireless sensor networks
 * Baseline LEACH rotation election.
 */

#ifndef ZCR_LEACH_PROTOCOL_H
#define ZCR_LEACH_PROTOCOL_H

#include "zcr-clustering-protocol.h"

#include "ns3/random-variable-stream.h"

#include <vector>

namespace ns3
{
namespace zcr
{

/**
 * @ingroup zcr
 * @brief LEACH: Low-Energy Adaptive Clustering Hierarchy.
 *
 * Every round each alive, eligible node draws an independent Bernoulli trial
 * with success probability
 *
 *   T(r) = p / (1 - p * (r mod L)),  L = round(1 / p)
 *
 * and becomes cluster head on success.  A node that served as CH is not
 * eligible again until the next cycle starts (r mod L == 0).  Non-CH nodes
 * join the nearest CH; CHs receive, aggregate and send one packet straight to
 * the sink.
 *
 * The realized number of CHs per round is random and may be zero; a round
 * without any CH charges nobody.
 */
class LeachProtocol : public ClusteringProtocol
{
  public:
    /**
     * @brief Get the type ID.
     * @return the object TypeId
     */
    static TypeId GetTypeId();

    LeachProtocol();
    ~LeachProtocol() override;

    void RunRound(SensorNetwork& network) override;
    std::string GetName() const override;
    int64_t AssignStreams(int64_t stream) override;

    /**
     * @brief Election threshold T(r) for a round.
     *
     * Saturates to 1 when the denominator is not positive.
     *
     * @param round round number
     * @returns T(round) in (0, 1]
     */
    double ComputeElectionThreshold(uint32_t round) const;

    /// @returns L = round(1 / p), saturated at the largest uint32_t, the rounds in one cycle
    uint32_t GetCycleLength() const;
    /// @returns the threshold used in the last executed round
    double GetElectionThreshold() const;
    /// @returns the ids of the cluster heads elected in the last executed round
    const std::vector<uint32_t>& GetClusterHeads() const;

  protected:
    void DoDispose() override;

  private:
    /**
     * Attach every alive non-CH node to its nearest elected CH.
     * @param network the network
     * @param radio radio model for this round
     */
    void FormClusters(SensorNetwork& network, const RadioEnergyModel& radio) const;

    double m_electionThreshold;             ///< T(r) of the last round
    std::vector<uint32_t> m_clusterHeads;   ///< CHs of the last round
    Ptr<UniformRandomVariable> m_electionRng; ///< Bernoulli trial stream
};

} // namespace zcr
} // namespace ns3

#endif /* ZCR_LEACH_PROTOCOL_H */
