/*
 * Copyright (c) 2026
 *
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * ZCR: Zone-based Clustering and Relaying for wireless sensor networks
 * LEACH implementation.
 */

#include "zcr-leach-protocol.h"

#include "ns3/log.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("ZcrLeachProtocol");

namespace zcr
{

NS_OBJECT_ENSURE_REGISTERED(LeachProtocol);

TypeId
LeachProtocol::GetTypeId()
{
    static TypeId tid = TypeId("ns3::zcr::LeachProtocol")
                            .SetParent<ClusteringProtocol>()
                            .SetGroupName("Zcr")
                            .AddConstructor<LeachProtocol>();
    return tid;
}

LeachProtocol::LeachProtocol()
    : m_electionThreshold(0.0)
{
    NS_LOG_FUNCTION(this);
    m_electionRng = CreateObject<UniformRandomVariable>();
}

LeachProtocol::~LeachProtocol()
{
    NS_LOG_FUNCTION(this);
}

void
LeachProtocol::DoDispose()
{
    m_electionRng = nullptr;
    m_clusterHeads.clear();
    ClusteringProtocol::DoDispose();
}

std::string
LeachProtocol::GetName() const
{
    return "LEACH";
}

int64_t
LeachProtocol::AssignStreams(int64_t stream)
{
    NS_LOG_FUNCTION(this << stream);
    m_electionRng->SetStream(stream);
    return 1;
}

uint32_t
LeachProtocol::GetCycleLength() const
{
    // Tiny probabilities give cycles longer than any simulated round count
    double cycles = std::round(1.0 / GetClusterHeadProbability());
    if (cycles >= static_cast<double>(std::numeric_limits<uint32_t>::max()))
    {
        return std::numeric_limits<uint32_t>::max();
    }
    return static_cast<uint32_t>(cycles);
}

double
LeachProtocol::ComputeElectionThreshold(uint32_t round) const
{
    double p = GetClusterHeadProbability();
    double denominator = 1.0 - p * (round % GetCycleLength());
    if (denominator <= 0.0)
    {
        return 1.0;
    }
    return std::min(1.0, p / denominator);
}

double
LeachProtocol::GetElectionThreshold() const
{
    return m_electionThreshold;
}

const std::vector<uint32_t>&
LeachProtocol::GetClusterHeads() const
{
    return m_clusterHeads;
}

void
LeachProtocol::RunRound(SensorNetwork& network)
{
    NS_LOG_FUNCTION(this << network.GetCurrentRound());

    uint32_t round = network.GetCurrentRound();
    bool newCycle = (round % GetCycleLength() == 0);
    m_electionThreshold = ComputeElectionThreshold(round);
    m_clusterHeads.clear();
    RadioEnergyModel radio = GetRadioEnergyModel();

    // Reset roles, retire exhausted nodes and run the election
    for (auto& node : network.GetNodes())
    {
        node.ResetRound();
        if (newCycle)
        {
            node.isEligibleForClusterHead = true;
        }

        if (node.isAlive && node.remainingEnergy <= 0.0)
        {
            network.MarkDead(node.id);
            continue;
        }

        if (node.isAlive && node.isEligibleForClusterHead &&
            m_electionRng->GetValue(0.0, 1.0) < m_electionThreshold)
        {
            node.isClusterHead = true;
            node.isEligibleForClusterHead = false;
            m_clusterHeads.push_back(node.id);
            NS_LOG_LOGIC("Node " << node.id << " elected CH");
        }
    }

    NS_LOG_DEBUG("LEACH round " << round << ": T=" << m_electionThreshold << ", "
                                << m_clusterHeads.size() << " CHs elected");

    FormClusters(network, radio);

    // Receive, aggregate and forward to the sink
    for (uint32_t headId : m_clusterHeads)
    {
        SensorNode& head = network.GetNode(headId);
        if (!head.isAlive)
        {
            continue;
        }
        ChargeAggregation(head, radio);
        ChargeTransmission(head, head.distanceToBaseStation, radio);
    }

    m_clusterHeadTrace(round, static_cast<uint32_t>(m_clusterHeads.size()));
}

void
LeachProtocol::FormClusters(SensorNetwork& network, const RadioEnergyModel& radio) const
{
    if (m_clusterHeads.empty())
    {
        return;
    }

    for (const auto& node : network.GetNodes())
    {
        if (!node.isAlive || node.isClusterHead)
        {
            continue;
        }

        double minDistance = std::numeric_limits<double>::infinity();
        uint32_t nearest = NO_CLUSTER_HEAD;
        for (uint32_t headId : m_clusterHeads)
        {
            double d = CalculateDistance(node.position, network.GetNode(headId).position);
            if (d < minDistance)
            {
                minDistance = d;
                nearest = headId;
            }
        }
        JoinClusterHead(network, node.id, nearest, radio);
    }
}

} // namespace zcr
} // namespace ns3
