/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef WEATHER_EVENT_HPP
#define WEATHER_EVENT_HPP

/**
 * @file WeatherEvent.hpp
 * @brief A region's weather changed
 *
 * Dispatched once per transition. The session layer shows the message to
 * players in exposed rooms of the region; indoor rooms ignore it.
 */

#include "Event.hpp"
#include <string>

class WeatherEvent : public Event {
public:
    WeatherEvent(std::string region, std::string previousWeather,
                 std::string weather, int intensity);
    ~WeatherEvent() override = default;

    void execute() override;
    void reset() override;

    // Event identification
    std::string getName() const override { return m_name; }
    std::string getType() const override { return "Weather"; }
    std::string getTypeName() const override { return "WeatherEvent"; }
    EventTypeId getTypeId() const override { return EventTypeId::Weather; }
    std::string getMessage() const override { return m_message; }

    // Weather-specific accessors
    [[nodiscard]] const std::string& getRegion() const { return m_region; }
    [[nodiscard]] const std::string& getPreviousWeather() const { return m_previousWeather; }
    [[nodiscard]] const std::string& getWeather() const { return m_weather; }
    [[nodiscard]] int getIntensity() const { return m_intensity; }

    void setMessage(std::string message);

private:
    std::string m_name;
    std::string m_region;
    std::string m_previousWeather;
    std::string m_weather;
    int m_intensity{0};
    std::string m_message;
};

#endif // WEATHER_EVENT_HPP
