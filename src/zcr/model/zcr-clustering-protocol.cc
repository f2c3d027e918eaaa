/*
 * Copyright (c) 2026
 *
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * ZCR: Zone-based Clustering and Relaying for wireless sensor networks
 * Clustering protocol base implementation.
 */

#include "zcr-clustering-protocol.h"

#include "ns3/abort.h"
#include "ns3/double.h"
#include "ns3/log.h"
#include "ns3/trace-source-accessor.h"
#include "ns3/uinteger.h"

#include <sstream>

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("ZcrClusteringProtocol");

namespace zcr
{

NS_OBJECT_ENSURE_REGISTERED(ClusteringProtocol);

TypeId
ClusteringProtocol::GetTypeId()
{
    static TypeId tid =
        TypeId("ns3::zcr::ClusteringProtocol")
            .SetParent<Object>()
            .SetGroupName("Zcr")
            .AddAttribute("ClusterHeadProbability",
                          "Desired fraction of alive nodes acting as cluster head each round.",
                          DoubleValue(0.1),
                          MakeDoubleAccessor(&ClusteringProtocol::SetClusterHeadProbability,
                                             &ClusteringProtocol::GetClusterHeadProbability),
                          MakeDoubleChecker<double>(0.0, 1.0))
            .AddAttribute("PacketSize",
                          "Size of one data packet in bits.",
                          UintegerValue(4000),
                          MakeUintegerAccessor(&ClusteringProtocol::m_packetSize),
                          MakeUintegerChecker<uint32_t>(1))
            .AddAttribute("ElectronicsEnergy",
                          "Radio electronics energy per bit, for both TX and RX (J/bit).",
                          DoubleValue(RadioEnergyModel::DEFAULT_ELECTRONICS_ENERGY),
                          MakeDoubleAccessor(&ClusteringProtocol::m_electronicsEnergy),
                          MakeDoubleChecker<double>(0.0))
            .AddAttribute("FreeSpaceAmplifierEnergy",
                          "Free-space amplifier energy (J/bit/m^2).",
                          DoubleValue(RadioEnergyModel::DEFAULT_FREE_SPACE_AMPLIFIER_ENERGY),
                          MakeDoubleAccessor(&ClusteringProtocol::m_freeSpaceEnergy),
                          MakeDoubleChecker<double>(0.0))
            .AddAttribute("MultipathAmplifierEnergy",
                          "Multipath amplifier energy (J/bit/m^4).",
                          DoubleValue(RadioEnergyModel::DEFAULT_MULTIPATH_AMPLIFIER_ENERGY),
                          MakeDoubleAccessor(&ClusteringProtocol::m_multipathEnergy),
                          MakeDoubleChecker<double>(0.0))
            .AddAttribute("AggregationEnergy",
                          "Data aggregation energy per bit per signal (J/bit).",
                          DoubleValue(RadioEnergyModel::DEFAULT_AGGREGATION_ENERGY),
                          MakeDoubleAccessor(&ClusteringProtocol::m_aggregationEnergy),
                          MakeDoubleChecker<double>(0.0))
            .AddAttribute("ThresholdDistance",
                          "Free-space/multipath threshold distance (m). "
                          "0 derives it as sqrt(FreeSpaceAmplifierEnergy / MultipathAmplifierEnergy).",
                          DoubleValue(0.0),
                          MakeDoubleAccessor(&ClusteringProtocol::m_thresholdDistance),
                          MakeDoubleChecker<double>(0.0))
            .AddTraceSource("ClusterHeadElection",
                            "Fired after every round with the number of cluster heads.",
                            MakeTraceSourceAccessor(&ClusteringProtocol::m_clusterHeadTrace),
                            "ns3::zcr::ClusteringProtocol::ClusterHeadElectionTracedCallback");
    return tid;
}

ClusteringProtocol::ClusteringProtocol()
    : m_clusterHeadProbability(0.1),
      m_packetSize(4000),
      m_electronicsEnergy(RadioEnergyModel::DEFAULT_ELECTRONICS_ENERGY),
      m_freeSpaceEnergy(RadioEnergyModel::DEFAULT_FREE_SPACE_AMPLIFIER_ENERGY),
      m_multipathEnergy(RadioEnergyModel::DEFAULT_MULTIPATH_AMPLIFIER_ENERGY),
      m_aggregationEnergy(RadioEnergyModel::DEFAULT_AGGREGATION_ENERGY),
      m_thresholdDistance(0.0)
{
    NS_LOG_FUNCTION(this);
}

ClusteringProtocol::~ClusteringProtocol()
{
    NS_LOG_FUNCTION(this);
}

bool
ClusteringProtocol::CheckProbability(double probability, std::string& reason)
{
    if (probability > 0.0 && probability <= 1.0)
    {
        reason.clear();
        return true;
    }
    std::ostringstream oss;
    oss << "cluster head probability must lie in (0, 1], got " << probability;
    reason = oss.str();
    return false;
}

void
ClusteringProtocol::SetClusterHeadProbability(double probability)
{
    NS_LOG_FUNCTION(this << probability);
    std::string reason;
    NS_ABORT_MSG_IF(!CheckProbability(probability, reason), "Invalid protocol: " << reason);
    m_clusterHeadProbability = probability;
}

double
ClusteringProtocol::GetClusterHeadProbability() const
{
    return m_clusterHeadProbability;
}

uint32_t
ClusteringProtocol::GetPacketSize() const
{
    return m_packetSize;
}

RadioEnergyModel
ClusteringProtocol::GetRadioEnergyModel() const
{
    return RadioEnergyModel(m_electronicsEnergy,
                            m_freeSpaceEnergy,
                            m_multipathEnergy,
                            m_aggregationEnergy,
                            m_thresholdDistance);
}

void
ClusteringProtocol::JoinClusterHead(SensorNetwork& network,
                                    uint32_t memberId,
                                    uint32_t headId,
                                    const RadioEnergyModel& radio) const
{
    SensorNode& member = network.GetNode(memberId);
    SensorNode& head = network.GetNode(headId);
    double distance = CalculateDistance(member.position, head.position);

    member.clusterHeadId = headId;
    head.clusterMemberIds.push_back(memberId);
    ChargeTransmission(member, distance, radio);
    NS_LOG_LOGIC("Node " << memberId << " joins CH " << headId << " at " << distance << " m");
}

void
ClusteringProtocol::ChargeAggregation(SensorNode& head, const RadioEnergyModel& radio) const
{
    double perMember = radio.ReceiveEnergy(m_packetSize) + radio.AggregationEnergy(m_packetSize);
    head.remainingEnergy -= perMember * head.clusterMemberIds.size();
}

void
ClusteringProtocol::ChargeTransmission(SensorNode& node,
                                       double distance,
                                       const RadioEnergyModel& radio) const
{
    node.remainingEnergy -= radio.TransmitEnergy(m_packetSize, distance);
}

} // namespace zcr
} // namespace ns3
