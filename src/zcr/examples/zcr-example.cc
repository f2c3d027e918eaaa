/*
 * Copyright (c) 2026
 *
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * ZCR: Zone-based Clustering and Relaying for wireless sensor networks
 * Minimal example: 100 sensors in a 500 m x 500 m field, run until every node
 * is dead or the round cap is reached.
 */

#include "ns3/core-module.h"
#include "ns3/zcr-helper.h"
#include "ns3/zcr-sensor-network.h"

#include <iostream>

using namespace ns3;

NS_LOG_COMPONENT_DEFINE("ZcrExample");

int
main(int argc, char* argv[])
{
    std::string protocol = "ZCR";
    uint32_t nNodes = zcr::SensorNetwork::DEFAULT_NODE_COUNT;
    double width = zcr::SensorNetwork::DEFAULT_AREA_WIDTH;
    double height = zcr::SensorNetwork::DEFAULT_AREA_HEIGHT;
    double energy = zcr::SensorNetwork::DEFAULT_INITIAL_ENERGY;
    double probability = 0.1;
    uint32_t packetSize = 4000;
    uint32_t maxRounds = 2000;
    uint32_t reportInterval = 100;
    uint32_t seed = 1;
    std::string energyCsv = "";
    bool verbose = false;

    CommandLine cmd(__FILE__);
    cmd.AddValue("protocol", "Clustering protocol: ZCR or LEACH", protocol);
    cmd.AddValue("nNodes", "Number of sensor nodes", nNodes);
    cmd.AddValue("width", "Deployment area width (m)", width);
    cmd.AddValue("height", "Deployment area height (m)", height);
    cmd.AddValue("energy", "Initial node energy (J)", energy);
    cmd.AddValue("probability", "Cluster head probability", probability);
    cmd.AddValue("packetSize", "Data packet size (bits)", packetSize);
    cmd.AddValue("maxRounds", "Round cap", maxRounds);
    cmd.AddValue("reportInterval", "Rounds between progress lines (0 disables)", reportInterval);
    cmd.AddValue("seed", "Random seed", seed);
    cmd.AddValue("energyCsv", "Write per-round node energy to this CSV file", energyCsv);
    cmd.AddValue("verbose", "Enable protocol logging", verbose);
    cmd.Parse(argc, argv);

    std::string reason;
    if (!zcr::SensorNetwork::CheckParameters(width, height, nNodes, energy, reason) ||
        !zcr::ClusteringProtocol::CheckProbability(probability, reason))
    {
        NS_FATAL_ERROR("Invalid configuration: " << reason);
    }

    if (verbose)
    {
        LogComponentEnable("ZcrExample", LOG_LEVEL_INFO);
        LogComponentEnable("ZcrLeachProtocol", LOG_LEVEL_DEBUG);
        LogComponentEnable("ZcrZoneClusteringProtocol", LOG_LEVEL_DEBUG);
    }

    SeedManager::SetSeed(seed);

    ZcrHelper zcrHelper;
    if (protocol == "LEACH")
    {
        zcrHelper.SetProtocol("ns3::zcr::LeachProtocol");
    }
    else if (protocol != "ZCR")
    {
        NS_FATAL_ERROR("Unknown protocol: " << protocol << ". Use 'ZCR' or 'LEACH'.");
    }
    zcrHelper.Set("ClusterHeadProbability", DoubleValue(probability));
    zcrHelper.Set("PacketSize", UintegerValue(packetSize));
    Ptr<zcr::ClusteringProtocol> agent = zcrHelper.Create();

    zcr::SensorNetwork network(width, height, energy);
    zcrHelper.AssignStreams(network, agent, 0);
    network.Deploy(nNodes);

    if (!energyCsv.empty())
    {
        Ptr<OutputStreamWrapper> csv = Create<OutputStreamWrapper>(energyCsv, std::ios::out);
        ZcrHelper::EnableEnergyTrace(network, csv);
    }

    std::cout << "Starting " << agent->GetName() << " with " << nNodes << " nodes for at most "
              << maxRounds << " rounds..." << std::endl;

    while (network.GetAliveNodeCount() > 0 && network.GetCurrentRound() < maxRounds)
    {
        uint32_t round = network.Advance(agent);
        if (reportInterval > 0 && round % reportInterval == 0)
        {
            std::cout << "round " << round << ": " << network.GetAliveNodeCount()
                      << " alive, average energy " << network.GetAverageRemainingEnergy() << " J"
                      << std::endl;
        }
    }

    NS_LOG_INFO("Stopped after round " << network.GetCurrentRound());
    std::cout << agent->GetName() << " finished after " << network.GetCurrentRound()
              << " rounds with " << network.GetAliveNodeCount() << " of " << network.GetNNodes()
              << " nodes alive" << std::endl;

    agent->Dispose();
    return 0;
}
