/*
 * Copyright (c) 2026
 *
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * ZCR: Zone-based Clustering and Relaying for wireless sensor networks
 * First-order radio energy model.
 */

#ifndef ZCR_RADIO_ENERGY_MODEL_H
#define ZCR_RADIO_ENERGY_MODEL_H

#include <cstdint>

namespace ns3
{
namespace zcr
{

/**
 * @ingroup zcr
 * @brief First-order radio energy model.
 *
 * Estimates the energy (Joules) spent by a sensor radio to transmit, receive
 * and aggregate a given number of bits.  Transmission uses the free-space
 * amplifier (d^2 loss) up to the threshold distance d0 and the multipath
 * amplifier (d^4 loss) beyond it:
 *
 *   E_tx(k, d) = k * E_elec + k * E_fs * d^2   if d <= d0
 *   E_tx(k, d) = k * E_elec + k * E_mp * d^4   if d >  d0
 *   E_rx(k)    = k * E_elec
 *   E_da(k)    = k * E_agg
 *
 * with d0 = sqrt(E_fs / E_mp).  The same d0 separates near-zone from
 * far-zone cluster heads in ZoneClusteringProtocol.
 *
 * The model is a passive value type: it holds no state other than its
 * constants and never fails.
 */
class RadioEnergyModel
{
  public:
    /// Energy to run the radio electronics (J/bit).
    static const double DEFAULT_ELECTRONICS_ENERGY;
    /// Free-space amplifier energy (J/bit/m^2).
    static const double DEFAULT_FREE_SPACE_AMPLIFIER_ENERGY;
    /// Multipath amplifier energy (J/bit/m^4).
    static const double DEFAULT_MULTIPATH_AMPLIFIER_ENERGY;
    /// Data aggregation energy (J/bit/signal).
    static const double DEFAULT_AGGREGATION_ENERGY;

    /// Construct a model with the default constants.
    RadioEnergyModel();

    /**
     * @brief Construct a model whose threshold distance is derived from the amplifiers.
     *
     * @param electronics  E_elec (J/bit)
     * @param freeSpace    E_fs (J/bit/m^2)
     * @param multipath    E_mp (J/bit/m^4)
     * @param aggregation  E_agg (J/bit)
     */
    RadioEnergyModel(double electronics, double freeSpace, double multipath, double aggregation);

    /**
     * @brief Construct a model with an explicit threshold distance.
     *
     * @param electronics  E_elec (J/bit)
     * @param freeSpace    E_fs (J/bit/m^2)
     * @param multipath    E_mp (J/bit/m^4)
     * @param aggregation  E_agg (J/bit)
     * @param threshold    d0 (m); a value <= 0 derives sqrt(E_fs / E_mp)
     */
    RadioEnergyModel(double electronics,
                     double freeSpace,
                     double multipath,
                     double aggregation,
                     double threshold);

    /**
     * @param freeSpace E_fs (J/bit/m^2)
     * @param multipath E_mp (J/bit/m^4)
     * @returns sqrt(freeSpace / multipath)
     */
    static double DeriveThresholdDistance(double freeSpace, double multipath);

    /**
     * @brief Energy to transmit bits over a distance.
     * @param bits     number of bits sent
     * @param distance distance to the receiver (m)
     * @returns energy in Joules
     */
    double TransmitEnergy(uint32_t bits, double distance) const;
    /**
     * @brief Energy to receive bits.
     * @param bits number of bits received
     * @returns energy in Joules
     */
    double ReceiveEnergy(uint32_t bits) const;
    /**
     * @brief Energy to aggregate one signal of the given size.
     * @param bits number of bits aggregated
     * @returns energy in Joules
     */
    double AggregationEnergy(uint32_t bits) const;

    /**
     * @returns true if a transmission over this distance uses the free-space amplifier.
     * @param distance distance in meters
     */
    bool IsFreeSpace(double distance) const
    {
        return distance <= m_threshold;
    }

    /// @returns the free-space / multipath threshold distance d0 (m)
    double GetThresholdDistance() const
    {
        return m_threshold;
    }

    /// @returns E_elec (J/bit)
    double GetElectronicsEnergy() const
    {
        return m_electronics;
    }

    /// @returns E_fs (J/bit/m^2)
    double GetFreeSpaceAmplifierEnergy() const
    {
        return m_freeSpace;
    }

    /// @returns E_mp (J/bit/m^4)
    double GetMultipathAmplifierEnergy() const
    {
        return m_multipath;
    }

    /// @returns E_agg (J/bit)
    double GetAggregationEnergy() const
    {
        return m_aggregation;
    }

  private:
    double m_electronics; ///< E_elec
    double m_freeSpace;   ///< E_fs
    double m_multipath;   ///< E_mp
    double m_aggregation; ///< E_agg
    double m_threshold;   ///< d0
};

} // namespace zcr
} // namespace ns3

#endif /* ZCR_RADIO_ENERGY_MODEL_H */
