/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "events/WeatherEvent.hpp"
#include "core/Logger.hpp"
#include <utility>

WeatherEvent::WeatherEvent(std::string region, std::string previousWeather,
                           std::string weather, int intensity)
    : m_region(std::move(region))
    , m_previousWeather(std::move(previousWeather))
    , m_weather(std::move(weather))
    , m_intensity(intensity)
{
    m_name = "WeatherEvent_" + m_region;
}

void WeatherEvent::execute() {
    WEATHER_INFO("Weather in " + m_region + " changed from " + m_previousWeather +
                 " to " + m_weather + " (intensity " + std::to_string(m_intensity) + ")");
}

void WeatherEvent::reset() {
    m_previousWeather.clear();
    m_weather.clear();
    m_intensity = 0;
    m_message.clear();
}

void WeatherEvent::setMessage(std::string message) {
    m_message = std::move(message);
}
