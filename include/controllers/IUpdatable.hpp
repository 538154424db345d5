/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef IUPDATABLE_HPP
#define IUPDATABLE_HPP

/**
 * @file IUpdatable.hpp
 * @brief Controllers that act on the world clock every server tick
 *
 * Attack tickers, combat rounds, leash checks and upkeep sweeps all
 * schedule against world seconds, so the tick hands them the clock reading
 * instead of a frame delta. Controllers that only answer queries
 * (WeatherController) stay event-only.
 */
class IUpdatable
{
public:
    virtual ~IUpdatable() = default;

    /**
     * @param worldSeconds WorldClock::now() for this tick
     */
    virtual void update(double worldSeconds) = 0;
};

#endif // IUPDATABLE_HPP
