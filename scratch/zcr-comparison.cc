/*
 * Copyright (c) 2026
 *
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * ZCR Comparison Simulation Script
 *
 * Compares ZCR against LEACH on identical node placements.
 * Metrics (network lifetime in rounds):
 *   1. FND: round in which the first node died
 *   2. HND: round in which half of the nodes were dead
 *   3. LND: round in which the last node died (or the round cap)
 *   4. Mean number of cluster heads per round
 *   5. Residual energy of the network at the round cap
 *
 * Multi-seed sweep with 95% CI reporting
 *
 * Output: CSV to stdout for piping to data files.
 */

#include "ns3/core-module.h"
#include "ns3/zcr-helper.h"
#include "ns3/zcr-sensor-network.h"

#include <cmath>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <vector>

using namespace ns3;

NS_LOG_COMPONENT_DEFINE("ZcrComparison");

// =============================================================================
// Global metric accumulators (reset per run)
// =============================================================================

/// Cluster heads selected, summed over all rounds of the current run.
static uint64_t g_clusterHeadTotal = 0;

/// Rounds reported by the ClusterHeadElection trace in the current run.
static uint32_t g_clusterHeadRounds = 0;

/**
 * @brief Trace sink for the per-round cluster head count.
 */
static void
ClusterHeadElectionSink(uint32_t round, uint32_t clusterHeads)
{
    g_clusterHeadTotal += clusterHeads;
    ++g_clusterHeadRounds;
}

/// Result of one protocol run.
struct RunResult
{
    uint32_t fnd;            ///< First node dead
    uint32_t hnd;            ///< Half nodes dead
    uint32_t lnd;            ///< Last node dead, or rounds executed
    double meanClusterHeads; ///< Mean CH count per round
    double residualEnergyJ;  ///< Energy left in alive nodes at the end
};

/**
 * @brief Run one protocol on a freshly deployed network.
 *
 * The placement stream is fixed to 0 so both protocols see the same field
 * for a given seed.
 */
static RunResult
RunSingleSimulation(std::string protocol,
                    uint32_t nNodes,
                    double areaSize,
                    double energy,
                    double probability,
                    uint32_t maxRounds,
                    uint32_t seed)
{
    RunResult result{};

    g_clusterHeadTotal = 0;
    g_clusterHeadRounds = 0;

    SeedManager::SetSeed(seed);
    SeedManager::SetRun(seed);

    ZcrHelper zcrHelper;
    zcrHelper.SetProtocol(protocol == "LEACH" ? "ns3::zcr::LeachProtocol"
                                              : "ns3::zcr::ZoneClusteringProtocol");
    zcrHelper.Set("ClusterHeadProbability", DoubleValue(probability));
    Ptr<zcr::ClusteringProtocol> agent = zcrHelper.Create();
    agent->TraceConnectWithoutContext("ClusterHeadElection", MakeCallback(&ClusterHeadElectionSink));

    zcr::SensorNetwork network(areaSize, areaSize, energy);
    zcrHelper.AssignStreams(network, agent, 0);
    network.Deploy(nNodes);

    while (network.GetAliveNodeCount() > 0 && network.GetCurrentRound() < maxRounds)
    {
        uint32_t round = network.Advance(agent);
        uint32_t dead = nNodes - network.GetAliveNodeCount();
        if (result.fnd == 0 && dead > 0)
        {
            result.fnd = round;
        }
        if (result.hnd == 0 && 2 * dead >= nNodes)
        {
            result.hnd = round;
        }
    }
    result.lnd = network.GetCurrentRound();
    result.meanClusterHeads =
        g_clusterHeadRounds > 0 ? static_cast<double>(g_clusterHeadTotal) / g_clusterHeadRounds
                                : 0.0;
    result.residualEnergyJ = network.GetTotalRemainingEnergy();

    NS_LOG_INFO(protocol << " seed " << seed << ": FND=" << result.fnd << " HND=" << result.hnd
                         << " LND=" << result.lnd);

    agent->Dispose();
    return result;
}

// =============================================================================
// Statistics helpers
// =============================================================================

/// Compute mean of a vector
static double
Mean(const std::vector<double>& v)
{
    if (v.empty())
    {
        return 0.0;
    }
    return std::accumulate(v.begin(), v.end(), 0.0) / v.size();
}

/// Compute sample standard deviation
static double
StdDev(const std::vector<double>& v, double mean)
{
    if (v.size() < 2)
    {
        return 0.0;
    }
    double sq = 0.0;
    for (double x : v)
    {
        sq += (x - mean) * (x - mean);
    }
    return std::sqrt(sq / (v.size() - 1));
}

/// Compute 95% confidence interval half-width
/// For simplicity, use z=1.96 (normal approx, valid for n >= 10)
static double
Ci95(const std::vector<double>& v, double mean)
{
    if (v.size() < 2)
    {
        return 0.0;
    }
    double sd = StdDev(v, mean);
    return 1.96 * sd / std::sqrt(static_cast<double>(v.size()));
}

// =============================================================================
// Main
// =============================================================================

int
main(int argc, char* argv[])
{
    uint32_t nNodes = zcr::SensorNetwork::DEFAULT_NODE_COUNT;
    double areaSize = zcr::SensorNetwork::DEFAULT_AREA_WIDTH;
    double energy = zcr::SensorNetwork::DEFAULT_INITIAL_ENERGY;
    double probability = 0.1;
    uint32_t maxRounds = 2000;
    uint32_t seedStart = 1;
    uint32_t nRuns = 1;
    bool verbose = false;

    CommandLine cmd(__FILE__);
    cmd.AddValue("nNodes", "Number of sensor nodes", nNodes);
    cmd.AddValue("areaSize", "Side length of square area in meters", areaSize);
    cmd.AddValue("energy", "Initial node energy (J)", energy);
    cmd.AddValue("probability", "Cluster head probability", probability);
    cmd.AddValue("maxRounds", "Round cap per run", maxRounds);
    cmd.AddValue("seedStart", "Starting random seed (multi-seed sweep)", seedStart);
    cmd.AddValue("nRuns", "Number of runs for CI (set > 1 for sweep)", nRuns);
    cmd.AddValue("verbose", "Enable verbose logging", verbose);
    cmd.Parse(argc, argv);

    std::string reason;
    if (!zcr::SensorNetwork::CheckParameters(areaSize, areaSize, nNodes, energy, reason) ||
        !zcr::ClusteringProtocol::CheckProbability(probability, reason))
    {
        NS_FATAL_ERROR("Invalid configuration: " << reason);
    }
    if (nRuns == 0)
    {
        NS_FATAL_ERROR("nRuns must be at least 1");
    }

    if (verbose)
    {
        LogComponentEnable("ZcrComparison", LOG_LEVEL_INFO);
    }

    if (nRuns == 1)
    {
        std::cout << "protocol,nNodes,areaSize,probability,seed,"
                  << "fnd,hnd,lnd,meanClusterHeads,residualEnergyJ" << std::endl;
    }
    else
    {
        std::cout << "protocol,nNodes,areaSize,probability,nRuns,"
                  << "fnd_mean,fnd_ci95,"
                  << "hnd_mean,hnd_ci95,"
                  << "lnd_mean,lnd_ci95,"
                  << "clusterHeads_mean,clusterHeads_ci95,"
                  << "residualEnergy_mean,residualEnergy_ci95" << std::endl;
    }

    for (std::string protocol : {"LEACH", "ZCR"})
    {
        std::vector<double> allFnd;
        std::vector<double> allHnd;
        std::vector<double> allLnd;
        std::vector<double> allClusterHeads;
        std::vector<double> allResidual;

        for (uint32_t run = 0; run < nRuns; ++run)
        {
            uint32_t seed = seedStart + run;
            RunResult r = RunSingleSimulation(protocol,
                                              nNodes,
                                              areaSize,
                                              energy,
                                              probability,
                                              maxRounds,
                                              seed);

            allFnd.push_back(r.fnd);
            allHnd.push_back(r.hnd);
            allLnd.push_back(r.lnd);
            allClusterHeads.push_back(r.meanClusterHeads);
            allResidual.push_back(r.residualEnergyJ);

            if (nRuns == 1)
            {
                std::cout << std::fixed << std::setprecision(2);
                std::cout << protocol << "," << nNodes << "," << areaSize << "," << probability
                          << "," << seed << "," << r.fnd << "," << r.hnd << "," << r.lnd << ","
                          << r.meanClusterHeads << "," << r.residualEnergyJ << std::endl;
            }
        }

        if (nRuns > 1)
        {
            double fndMean = Mean(allFnd);
            double hndMean = Mean(allHnd);
            double lndMean = Mean(allLnd);
            double chMean = Mean(allClusterHeads);
            double resMean = Mean(allResidual);

            std::cout << std::fixed << std::setprecision(2);
            std::cout << protocol << "," << nNodes << "," << areaSize << "," << probability << ","
                      << nRuns << ","
                      << fndMean << "," << Ci95(allFnd, fndMean) << ","
                      << hndMean << "," << Ci95(allHnd, hndMean) << ","
                      << lndMean << "," << Ci95(allLnd, lndMean) << ","
                      << chMean << "," << Ci95(allClusterHeads, chMean) << ","
                      << resMean << "," << Ci95(allResidual, resMean) << std::endl;
        }
    }

    return 0;
}
