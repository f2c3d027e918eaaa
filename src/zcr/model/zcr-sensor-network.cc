/*
 * Copyright (c) 2026
 *
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * ZCR: Zone-based Clustering and Relaying for wireless sensor networks
 * Sensor network and simulation driver implementation.
 */

#include "zcr-sensor-network.h"

#include "zcr-clustering-protocol.h"

#include "ns3/abort.h"
#include "ns3/assert.h"
#include "ns3/log.h"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("ZcrSensorNetwork");

namespace zcr
{

const double SensorNetwork::DEFAULT_AREA_WIDTH = 500.0;
const double SensorNetwork::DEFAULT_AREA_HEIGHT = 500.0;
const uint32_t SensorNetwork::DEFAULT_NODE_COUNT = 100;
const double SensorNetwork::DEFAULT_INITIAL_ENERGY = 2.0;

std::ostream&
operator<<(std::ostream& os, const EnergyRecord& record)
{
    os << record.round << "," << record.aliveNodes << "," << record.nodeId << ","
       << record.remainingEnergy;
    return os;
}

SensorNetwork::SensorNetwork(double width, double height, double initialEnergy)
    : SensorNetwork(width, height, initialEnergy, Vector2D(width / 2.0, height / 2.0))
{
}

SensorNetwork::SensorNetwork(double width,
                             double height,
                             double initialEnergy,
                             const Vector2D& baseStation)
    : m_currentRound(0),
      m_aliveNodeCount(0),
      m_width(width),
      m_height(height),
      m_initialEnergy(initialEnergy),
      m_baseStation(baseStation)
{
    NS_LOG_FUNCTION(this << width << height << initialEnergy << baseStation);
    std::string reason;
    // The node count is checked by Deploy(); pass a valid placeholder here.
    NS_ABORT_MSG_IF(!CheckParameters(width, height, 1, initialEnergy, reason),
                    "Invalid sensor network: " << reason);
    m_positionRng = CreateObject<UniformRandomVariable>();
}

bool
SensorNetwork::CheckParameters(double width,
                               double height,
                               uint32_t nodeCount,
                               double initialEnergy,
                               std::string& reason)
{
    std::ostringstream oss;
    if (!(width > 0.0) || !(height > 0.0))
    {
        oss << "area dimensions must be positive, got " << width << " x " << height;
    }
    else if (nodeCount == 0)
    {
        oss << "node count must be positive";
    }
    else if (!(initialEnergy > 0.0))
    {
        oss << "initial energy must be positive, got " << initialEnergy;
    }
    reason = oss.str();
    return reason.empty();
}

void
SensorNetwork::Deploy(uint32_t nodeCount)
{
    NS_LOG_FUNCTION(this << nodeCount);
    NS_ABORT_MSG_IF(nodeCount == 0, "Invalid sensor network: node count must be positive");

    double minX = std::min(1.0, m_width);
    double minY = std::min(1.0, m_height);
    for (uint32_t i = 0; i < nodeCount; ++i)
    {
        double x = m_positionRng->GetValue(minX, m_width);
        double y = m_positionRng->GetValue(minY, m_height);
        AddNode(Vector2D(x, y));
    }
    NS_LOG_DEBUG("Deployed " << nodeCount << " nodes in " << m_width << " x " << m_height
                             << " m, sink at " << m_baseStation);
}

uint32_t
SensorNetwork::AddNode(const Vector2D& position)
{
    uint32_t id = static_cast<uint32_t>(m_nodes.size());
    m_nodes.emplace_back(id, position, m_initialEnergy, m_baseStation);
    ++m_aliveNodeCount;
    NS_LOG_LOGIC("Node " << id << " at " << position << ", "
                         << m_nodes.back().distanceToBaseStation << " m from the sink");
    return id;
}

int64_t
SensorNetwork::AssignStreams(int64_t stream)
{
    NS_LOG_FUNCTION(this << stream);
    m_positionRng->SetStream(stream);
    return 1;
}

uint32_t
SensorNetwork::Advance(Ptr<ClusteringProtocol> protocol)
{
    NS_LOG_FUNCTION(this << protocol);
    NS_ASSERT_MSG(protocol, "Advance needs a protocol");

    ++m_currentRound;
    protocol->RunRound(*this);

    NS_LOG_DEBUG(protocol->GetName() << " round " << m_currentRound << ": " << m_aliveNodeCount
                                     << " of " << m_nodes.size() << " nodes alive");

    for (const auto& node : m_nodes)
    {
        EnergyRecord record = {m_currentRound, m_aliveNodeCount, node.id, node.remainingEnergy};
        m_energyRecordTrace(record);
    }
    return m_currentRound;
}

void
SensorNetwork::MarkDead(uint32_t id)
{
    NS_ASSERT_MSG(id < m_nodes.size(), "No node with id " << id);
    SensorNode& node = m_nodes[id];
    if (!node.isAlive)
    {
        return;
    }
    node.isAlive = false;
    --m_aliveNodeCount;
    NS_LOG_LOGIC("Node " << id << " died in round " << m_currentRound << " ("
                         << node.remainingEnergy << " J left)");
}

std::vector<SensorNode>&
SensorNetwork::GetNodes()
{
    return m_nodes;
}

const std::vector<SensorNode>&
SensorNetwork::GetNodes() const
{
    return m_nodes;
}

SensorNode&
SensorNetwork::GetNode(uint32_t id)
{
    NS_ASSERT_MSG(id < m_nodes.size(), "No node with id " << id);
    return m_nodes[id];
}

const SensorNode&
SensorNetwork::GetNode(uint32_t id) const
{
    NS_ASSERT_MSG(id < m_nodes.size(), "No node with id " << id);
    return m_nodes[id];
}

uint32_t
SensorNetwork::GetNNodes() const
{
    return static_cast<uint32_t>(m_nodes.size());
}

uint32_t
SensorNetwork::GetCurrentRound() const
{
    return m_currentRound;
}

uint32_t
SensorNetwork::GetAliveNodeCount() const
{
    return m_aliveNodeCount;
}

uint32_t
SensorNetwork::CountAliveNodes() const
{
    return static_cast<uint32_t>(std::count_if(m_nodes.begin(),
                                               m_nodes.end(),
                                               [](const SensorNode& n) { return n.isAlive; }));
}

double
SensorNetwork::GetAreaWidth() const
{
    return m_width;
}

double
SensorNetwork::GetAreaHeight() const
{
    return m_height;
}

double
SensorNetwork::GetAreaDiagonal() const
{
    return std::sqrt(m_width * m_width + m_height * m_height);
}

double
SensorNetwork::GetInitialEnergy() const
{
    return m_initialEnergy;
}

Vector2D
SensorNetwork::GetBaseStation() const
{
    return m_baseStation;
}

double
SensorNetwork::GetTotalRemainingEnergy() const
{
    double total = 0.0;
    for (const auto& node : m_nodes)
    {
        if (node.isAlive)
        {
            total += node.remainingEnergy;
        }
    }
    return total;
}

double
SensorNetwork::GetAverageRemainingEnergy() const
{
    if (m_aliveNodeCount == 0)
    {
        return 0.0;
    }
    return GetTotalRemainingEnergy() / m_aliveNodeCount;
}

std::vector<EnergyRecord>
SensorNetwork::GetEnergyRecords() const
{
    std::vector<EnergyRecord> records;
    records.reserve(m_nodes.size());
    for (const auto& node : m_nodes)
    {
        records.push_back({m_currentRound, m_aliveNodeCount, node.id, node.remainingEnergy});
    }
    return records;
}

std::vector<NodeSnapshot>
SensorNetwork::GetSnapshot() const
{
    std::vector<NodeSnapshot> snapshot;
    snapshot.reserve(m_nodes.size());
    for (const auto& node : m_nodes)
    {
        snapshot.push_back({node.id, node.position, node.isAlive, node.isClusterHead});
    }
    return snapshot;
}

} // namespace zcr
} // namespace ns3
