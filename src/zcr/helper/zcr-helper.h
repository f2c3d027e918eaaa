/*
 * Copyright (c) 2026
 *
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * ZCR: Zone-based Clustering and Relaying for wireless sensor networks
 * Helper class that builds clustering protocols and wires up traces.
 */

#ifndef ZCR_HELPER_H
#define ZCR_HELPER_H

#include "ns3/object-factory.h"
#include "ns3/output-stream-wrapper.h"
#include "ns3/zcr-clustering-protocol.h"
#include "ns3/zcr-sensor-network.h"

#include <string>

namespace ns3
{
/**
 * @ingroup zcr
 * @brief Helper class that creates ZCR or LEACH protocol instances.
 *
 * The helper defaults to ns3::zcr::ZoneClusteringProtocol.
 */
class ZcrHelper
{
  public:
    ZcrHelper();

    /**
     * @param type the TypeId name of the protocol, e.g. "ns3::zcr::LeachProtocol"
     */
    void SetProtocol(std::string type);

    /**
     * @param name the name of the attribute to set
     * @param value the value of the attribute to set.
     *
     * This method controls the attributes of the protocol being created
     */
    void Set(std::string name, const AttributeValue& value);

    /**
     * @returns a newly-created protocol
     */
    Ptr<zcr::ClusteringProtocol> Create() const;

    /**
     * Assign fixed random variable stream numbers to the network placement and
     * to the protocol.
     *
     * @param network the sensor network
     * @param protocol the protocol that will drive it
     * @param stream first stream index to use
     * @return the number of stream indices assigned by this helper
     */
    int64_t AssignStreams(zcr::SensorNetwork& network,
                          Ptr<zcr::ClusteringProtocol> protocol,
                          int64_t stream);

    /**
     * @brief Write the per-round energy records of a network as CSV.
     *
     * Writes the header line immediately and one line per record after every
     * round: round,alive_nodes,node_id,remaining_energy_j
     *
     * @param network the network to trace
     * @param stream the output stream wrapper
     */
    static void EnableEnergyTrace(zcr::SensorNetwork& network, Ptr<OutputStreamWrapper> stream);

  private:
    /** the factory to create protocol objects */
    ObjectFactory m_protocolFactory;
};

} // namespace ns3

#endif /* ZCR_HELPER_H */
