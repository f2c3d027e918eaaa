/*
 * Copyright (c) 2026
 *
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * ZCR: Zone-based Clustering and Relaying for wireless sensor networks
 * First-order radio energy model implementation.
 */

#include "zcr-radio-energy-model.h"

#include "ns3/assert.h"
#include "ns3/log.h"

#include <cmath>

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("ZcrRadioEnergyModel");

namespace zcr
{

const double RadioEnergyModel::DEFAULT_ELECTRONICS_ENERGY = 5e-8;
const double RadioEnergyModel::DEFAULT_FREE_SPACE_AMPLIFIER_ENERGY = 1e-11;
const double RadioEnergyModel::DEFAULT_MULTIPATH_AMPLIFIER_ENERGY = 1.3e-15;
const double RadioEnergyModel::DEFAULT_AGGREGATION_ENERGY = 5e-9;

RadioEnergyModel::RadioEnergyModel()
    : RadioEnergyModel(DEFAULT_ELECTRONICS_ENERGY,
                       DEFAULT_FREE_SPACE_AMPLIFIER_ENERGY,
                       DEFAULT_MULTIPATH_AMPLIFIER_ENERGY,
                       DEFAULT_AGGREGATION_ENERGY)
{
}

RadioEnergyModel::RadioEnergyModel(double electronics,
                                   double freeSpace,
                                   double multipath,
                                   double aggregation)
    : RadioEnergyModel(electronics, freeSpace, multipath, aggregation, 0.0)
{
}

RadioEnergyModel::RadioEnergyModel(double electronics,
                                   double freeSpace,
                                   double multipath,
                                   double aggregation,
                                   double threshold)
    : m_electronics(electronics),
      m_freeSpace(freeSpace),
      m_multipath(multipath),
      m_aggregation(aggregation),
      m_threshold(threshold)
{
    NS_LOG_FUNCTION(this << electronics << freeSpace << multipath << aggregation << threshold);
    if (m_threshold <= 0.0)
    {
        m_threshold = DeriveThresholdDistance(m_freeSpace, m_multipath);
    }
    NS_LOG_LOGIC("Free-space/multipath threshold " << m_threshold << " m");
}

double
RadioEnergyModel::DeriveThresholdDistance(double freeSpace, double multipath)
{
    NS_ASSERT_MSG(freeSpace > 0.0 && multipath > 0.0,
                  "Amplifier energies must be positive to derive d0");
    return std::sqrt(freeSpace / multipath);
}

double
RadioEnergyModel::TransmitEnergy(uint32_t bits, double distance) const
{
    double energy = bits * m_electronics;
    if (IsFreeSpace(distance))
    {
        energy += bits * m_freeSpace * distance * distance;
    }
    else
    {
        energy += bits * m_multipath * std::pow(distance, 4);
    }
    return energy;
}

double
RadioEnergyModel::ReceiveEnergy(uint32_t bits) const
{
    return bits * m_electronics;
}

double
RadioEnergyModel::AggregationEnergy(uint32_t bits) const
{
    return bits * m_aggregation;
}

} // namespace zcr
} // namespace ns3
