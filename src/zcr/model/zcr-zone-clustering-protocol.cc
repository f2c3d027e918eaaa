/*
 * Copyright (c) 2026
 *
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * ZCR: Zone-based Clustering and Relaying for wireless sensor networks
 * Zone-based clustering protocol implementation.
 */

#include "zcr-zone-clustering-protocol.h"

#include "zcr-kmeans.h"

#include "ns3/log.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("ZcrZoneClusteringProtocol");

namespace zcr
{

NS_OBJECT_ENSURE_REGISTERED(ZoneClusteringProtocol);

TypeId
ZoneClusteringProtocol::GetTypeId()
{
    static TypeId tid = TypeId("ns3::zcr::ZoneClusteringProtocol")
                            .SetParent<ClusteringProtocol>()
                            .SetGroupName("Zcr")
                            .AddConstructor<ZoneClusteringProtocol>();
    return tid;
}

ZoneClusteringProtocol::ZoneClusteringProtocol()
    : m_desiredClusters(0),
      m_relayCount(0)
{
    NS_LOG_FUNCTION(this);
    m_clusteringRng = CreateObject<UniformRandomVariable>();
}

ZoneClusteringProtocol::~ZoneClusteringProtocol()
{
    NS_LOG_FUNCTION(this);
}

void
ZoneClusteringProtocol::DoDispose()
{
    m_clusteringRng = nullptr;
    m_nearHeads.clear();
    m_farHeads.clear();
    ClusteringProtocol::DoDispose();
}

std::string
ZoneClusteringProtocol::GetName() const
{
    return "ZCR";
}

int64_t
ZoneClusteringProtocol::AssignStreams(int64_t stream)
{
    NS_LOG_FUNCTION(this << stream);
    m_clusteringRng->SetStream(stream);
    return 1;
}

uint32_t
ZoneClusteringProtocol::ComputeDesiredClusterCount(uint32_t aliveNodes) const
{
    // The small offset keeps products such as 0.1 * 30 from rounding up to 4.
    double expected = GetClusterHeadProbability() * aliveNodes;
    return static_cast<uint32_t>(std::ceil(expected - 1e-9));
}

uint32_t
ZoneClusteringProtocol::GetDesiredClusterCount() const
{
    return m_desiredClusters;
}

const std::vector<uint32_t>&
ZoneClusteringProtocol::GetNearZoneClusterHeads() const
{
    return m_nearHeads;
}

const std::vector<uint32_t>&
ZoneClusteringProtocol::GetFarZoneClusterHeads() const
{
    return m_farHeads;
}

uint32_t
ZoneClusteringProtocol::GetRelayCount() const
{
    return m_relayCount;
}

void
ZoneClusteringProtocol::RunRound(SensorNetwork& network)
{
    NS_LOG_FUNCTION(this << network.GetCurrentRound());

    uint32_t round = network.GetCurrentRound();
    m_nearHeads.clear();
    m_farHeads.clear();
    m_relayCount = 0;

    m_desiredClusters = ComputeDesiredClusterCount(network.GetAliveNodeCount());
    if (m_desiredClusters == 0)
    {
        NS_LOG_DEBUG("ZCR round " << round << ": no alive node, nothing to do");
        m_clusterHeadTrace(round, 0);
        return;
    }

    // Only nodes that survive this round take part in clustering
    std::vector<uint32_t> candidates;
    std::vector<Vector2D> positions;
    for (const auto& node : network.GetNodes())
    {
        if (node.isAlive && node.remainingEnergy > 0.0)
        {
            candidates.push_back(node.id);
            positions.push_back(node.position);
        }
    }

    uint32_t k = std::min(m_desiredClusters, static_cast<uint32_t>(candidates.size()));
    KMeans kmeans(k, m_clusteringRng);
    if (k > 0)
    {
        kmeans.Fit(positions);
    }

    for (auto& node : network.GetNodes())
    {
        node.ResetRound();
        if (node.isAlive && node.remainingEnergy <= 0.0)
        {
            network.MarkDead(node.id);
        }
    }

    if (k == 0)
    {
        NS_LOG_DEBUG("ZCR round " << round << ": every remaining node is exhausted");
        m_clusterHeadTrace(round, 0);
        return;
    }

    const std::vector<uint32_t>& assignments = kmeans.GetAssignments();
    std::vector<uint32_t> heads =
        SelectClusterHeads(network, candidates, assignments, kmeans.GetCentroids());
    RadioEnergyModel radio = GetRadioEnergyModel();

    for (uint32_t headId : heads)
    {
        if (headId == NO_CLUSTER_HEAD)
        {
            continue;
        }
        SensorNode& head = network.GetNode(headId);
        head.isClusterHead = true;
        if (radio.IsFreeSpace(head.distanceToBaseStation))
        {
            m_nearHeads.push_back(headId);
        }
        else
        {
            m_farHeads.push_back(headId);
        }
    }

    // Members report to the head of their own K-Means cluster
    for (uint32_t i = 0; i < candidates.size(); ++i)
    {
        uint32_t headId = heads[assignments[i]];
        if (headId == NO_CLUSTER_HEAD || network.GetNode(candidates[i]).isClusterHead)
        {
            continue;
        }
        JoinClusterHead(network, candidates[i], headId, radio);
    }

    for (uint32_t headId : m_nearHeads)
    {
        SensorNode& head = network.GetNode(headId);
        ChargeAggregation(head, radio);
        ChargeTransmission(head, head.distanceToBaseStation, radio);
    }
    DissipateFarZone(network, radio);

    NS_LOG_DEBUG("ZCR round " << round << ": k=" << k << " (desired " << m_desiredClusters
                              << "), " << kmeans.GetIterations() << " K-Means iterations, "
                              << m_nearHeads.size() << " near / " << m_farHeads.size()
                              << " far CHs, " << m_relayCount << " relays");
    m_clusterHeadTrace(round, static_cast<uint32_t>(m_nearHeads.size() + m_farHeads.size()));
}

std::vector<uint32_t>
ZoneClusteringProtocol::SelectClusterHeads(const SensorNetwork& network,
                                           const std::vector<uint32_t>& candidates,
                                           const std::vector<uint32_t>& assignments,
                                           const std::vector<Vector2D>& centroids) const
{
    std::vector<uint32_t> heads(centroids.size(), NO_CLUSTER_HEAD);
    std::vector<double> bestScore(centroids.size(), -std::numeric_limits<double>::infinity());
    double initialEnergy = network.GetInitialEnergy();
    double diagonal = network.GetAreaDiagonal();

    for (uint32_t i = 0; i < candidates.size(); ++i)
    {
        const SensorNode& node = network.GetNode(candidates[i]);
        if (!node.isAlive)
        {
            continue;
        }
        uint32_t cluster = assignments[i];
        double score = node.remainingEnergy / initialEnergy -
                       CalculateDistance(node.position, centroids[cluster]) / diagonal;
        if (score > bestScore[cluster])
        {
            bestScore[cluster] = score;
            heads[cluster] = node.id;
        }
    }
    return heads;
}

void
ZoneClusteringProtocol::DissipateFarZone(SensorNetwork& network, const RadioEnergyModel& radio)
{
    uint32_t bits = GetPacketSize();
    for (uint32_t headId : m_farHeads)
    {
        SensorNode& head = network.GetNode(headId);
        ChargeAggregation(head, radio);

        uint32_t relayId = NO_CLUSTER_HEAD;
        double relayDistance = std::numeric_limits<double>::infinity();
        for (uint32_t nearId : m_nearHeads)
        {
            double d = CalculateDistance(head.position, network.GetNode(nearId).position);
            if (d < relayDistance)
            {
                relayDistance = d;
                relayId = nearId;
            }
        }

        if (relayId != NO_CLUSTER_HEAD && relayDistance < head.distanceToBaseStation)
        {
            ChargeTransmission(head, relayDistance, radio);
            SensorNode& relay = network.GetNode(relayId);
            relay.remainingEnergy -= radio.ReceiveEnergy(bits) + radio.AggregationEnergy(bits);
            ++m_relayCount;
            NS_LOG_LOGIC("Far CH " << headId << " relays through near CH " << relayId << " ("
                                   << relayDistance << " m instead of "
                                   << head.distanceToBaseStation << " m)");
        }
        else
        {
            ChargeTransmission(head, head.distanceToBaseStation, radio);
            NS_LOG_LOGIC("Far CH " << headId << " sends directly to the sink");
        }
    }
}

} // namespace zcr
} // namespace ns3
