/*
 * Copyright (c) 2026
 *
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * ZCR: Zone-based Clustering and Relaying for wireless sensor networks
 * Helper class implementation.
 */

#include "zcr-helper.h"

#include "ns3/assert.h"
#include "ns3/callback.h"
#include "ns3/log.h"

#include <iomanip>

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("ZcrHelper");

/**
 * Trace sink writing one energy record per line.
 * @param stream the output stream wrapper
 * @param record the record
 */
static void
WriteEnergyRecord(Ptr<OutputStreamWrapper> stream, const zcr::EnergyRecord& record)
{
    *stream->GetStream() << record << "\n";
}

ZcrHelper::ZcrHelper()
{
    m_protocolFactory.SetTypeId("ns3::zcr::ZoneClusteringProtocol");
}

void
ZcrHelper::SetProtocol(std::string type)
{
    NS_LOG_FUNCTION(this << type);
    m_protocolFactory.SetTypeId(type);
}

void
ZcrHelper::Set(std::string name, const AttributeValue& value)
{
    m_protocolFactory.Set(name, value);
}

Ptr<zcr::ClusteringProtocol>
ZcrHelper::Create() const
{
    Ptr<zcr::ClusteringProtocol> protocol = m_protocolFactory.Create<zcr::ClusteringProtocol>();
    NS_ASSERT_MSG(protocol, "Type " << m_protocolFactory.GetTypeId().GetName()
                                    << " is not a clustering protocol");
    return protocol;
}

int64_t
ZcrHelper::AssignStreams(zcr::SensorNetwork& network,
                         Ptr<zcr::ClusteringProtocol> protocol,
                         int64_t stream)
{
    int64_t currentStream = stream;
    currentStream += network.AssignStreams(currentStream);
    currentStream += protocol->AssignStreams(currentStream);
    return (currentStream - stream);
}

void
ZcrHelper::EnableEnergyTrace(zcr::SensorNetwork& network, Ptr<OutputStreamWrapper> stream)
{
    std::ostream* os = stream->GetStream();
    *os << std::setprecision(9);
    *os << "round,alive_nodes,node_id,remaining_energy_j\n";
    network.m_energyRecordTrace.ConnectWithoutContext(MakeBoundCallback(&WriteEnergyRecord, stream));
}

} // namespace ns3
