/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "controllers/world/WeatherController.hpp"
#include "core/Logger.hpp"
#include "core/WorldClock.hpp"
#include "events/PresenceEvent.hpp"
#include "events/WeatherEvent.hpp"
#include "managers/ContentRegistry.hpp"
#include "utils/DiceRoller.hpp"
#include <algorithm>
#include <cmath>
#include <memory>

using AnchorMud::DiceRoller;
using AnchorMud::Exposure;
using AnchorMud::WeatherTransitionTable;
using AnchorMud::WeatherWeights;

namespace {

constexpr double FIRST_CHANGE_DELAY = 900.0;
constexpr int MAX_INTENSITY = 3;

} // namespace

WeatherController::WeatherController(const AnchorMud::RuntimeSettings& settings)
    : m_settings(settings), m_transitions(defaultTransitions())
{
    if (ContentRegistry::Instance().isLoaded() &&
        !ContentRegistry::Instance().getWeatherTransitions().empty()) {
        setTransitionTable(ContentRegistry::Instance().getWeatherTransitions());
    }
}

void WeatherController::subscribe()
{
    if (checkAlreadySubscribed()) {
        return;
    }

    auto token = EventManager::Instance().registerHandlerWithToken(
        EventTypeId::Presence,
        [this](const EventData& data) { onPresenceEvent(data); });
    addHandlerToken(token);

    setSubscribed(true);
    WEATHER_INFO("Subscribed to presence events for lazy weather resolution");
}

void WeatherController::onPresenceEvent(const EventData& data)
{
    auto presence = std::dynamic_pointer_cast<PresenceEvent>(data.event);
    if (!presence || presence->getChange() != PresenceChange::Entered ||
        presence->getRoomId().empty()) {
        return;
    }
    if (!presence->getEntity().isPlayer()) {
        return;
    }
    resolveForRoom(presence->getRoomId(), WorldClock::Instance().now());
}

const WeatherTransitionTable& WeatherController::defaultTransitions()
{
    static const WeatherTransitionTable table{
        {"clear", {{"clear", 50}, {"fog", 30}, {"wind", 20}}},
        {"cold_snap", {{"clear", 60}, {"cold_snap", 40}}},
        {"fog", {{"clear", 40}, {"fog", 40}, {"squall", 20}}},
        {"salt_rain", {{"clear", 50}, {"salt_rain", 50}}},
        {"squall", {{"clear", 50}, {"wind", 50}}},
        {"wind", {{"clear", 30}, {"squall", 20}, {"wind", 50}}},
    };
    return table;
}

void WeatherController::setTransitionTable(const WeatherTransitionTable& table)
{
    WeatherTransitionTable cleaned;
    for (const auto& [from, row] : table) {
        WeatherWeights kept;
        for (const auto& [to, weight] : row) {
            if (weight > 0) {
                kept.emplace_back(to, weight);
            }
        }
        if (kept.empty()) {
            WEATHER_WARN("Dropping weather row '" + from + "' with no positive weight");
            continue;
        }
        std::sort(kept.begin(), kept.end());
        cleaned.emplace(from, std::move(kept));
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_transitions = std::move(cleaned);
}

std::string WeatherController::rollNextWeather(const WeatherWeights& row, DiceRoller& roller)
{
    int total = 0;
    for (const auto& [type, weight] : row) {
        total += std::max(0, weight);
    }
    if (total <= 0) {
        return "clear";
    }

    int pick = roller.rollRange(1, total);
    for (const auto& [type, weight] : row) {
        pick -= std::max(0, weight);
        if (pick <= 0) {
            return type;
        }
    }
    return row.back().first;
}

double WeatherController::rollDuration(DiceRoller& roller) const
{
    auto lo = static_cast<int>(m_settings.weatherMinDuration);
    auto hi = static_cast<int>(std::max(m_settings.weatherMinDuration, m_settings.weatherMaxDuration));
    return static_cast<double>(roller.rollRange(lo, hi));
}

RegionWeather& WeatherController::findOrCreate(const std::string& region, double now)
{
    auto it = m_regions.find(region);
    if (it != m_regions.end()) {
        return it->second;
    }

    RegionWeather state;
    state.region = region;
    state.startedAt = now;
    state.nextChangeAt = now + FIRST_CHANGE_DELAY;
    state.seed = AnchorMud::deriveSeed(m_settings.worldSeed, region);

    if (const auto* def = ContentRegistry::Instance().getRegion(region)) {
        if (!def->initialWeather.empty()) {
            state.type = def->initialWeather;
        }
        if (def->seed) {
            state.seed = *def->seed;
        }
    }

    WEATHER_DEBUG("Region " + region + " starts with " + state.type);
    return m_regions.emplace(region, std::move(state)).first->second;
}

std::optional<std::string> WeatherController::transition(RegionWeather& state, double now)
{
    if (now < state.nextChangeAt) {
        return std::nullopt;
    }

    DiceRoller roller(AnchorMud::deriveSeed(state.seed, "weather", state.transitions));

    auto row = m_transitions.find(state.type);
    std::string next = (row == m_transitions.end()) ? std::string("clear")
                                                     : rollNextWeather(row->second, roller);

    std::string previous = state.type;
    int delta = (next == "clear") ? -1 : 1;
    state.type = next;
    state.intensity = std::clamp(state.intensity + delta, 0, MAX_INTENSITY);
    state.startedAt = now;
    state.nextChangeAt = now + rollDuration(roller);
    ++state.transitions;
    return previous;
}

RegionWeather WeatherController::resolveRegion(const std::string& region, double now)
{
    RegionWeather snapshot;
    std::optional<std::string> previous;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        RegionWeather& state = findOrCreate(region, now);
        previous = transition(state, now);
        snapshot = state;
    }

    if (previous && *previous != snapshot.type) {
        WEATHER_INFO("Region " + region + ": " + *previous + " -> " + snapshot.type +
                     " (intensity " + std::to_string(snapshot.intensity) + ")");
        announce(snapshot, *previous);
    }
    return snapshot;
}

std::optional<RegionWeather> WeatherController::resolveForRoom(const std::string& roomId,
                                                               double now)
{
    const auto* room = ContentRegistry::Instance().getRoom(roomId);
    if (!room || room->region.empty()) {
        return std::nullopt;
    }
    return resolveRegion(room->region, now);
}

std::optional<RegionWeather> WeatherController::peekRegion(const std::string& region) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_regions.find(region);
    if (it == m_regions.end()) {
        return std::nullopt;
    }
    return it->second;
}

void WeatherController::setWeather(const std::string& region, const std::string& type,
                                   int intensity, double now)
{
    RegionWeather snapshot;
    std::string previous;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        RegionWeather& state = findOrCreate(region, now);
        previous = state.type;
        state.type = type;
        state.intensity = std::clamp(intensity, 0, MAX_INTENSITY);
        state.startedAt = now;
        DiceRoller roller(AnchorMud::deriveSeed(state.seed, "forced", state.transitions));
        state.nextChangeAt = now + rollDuration(roller);
        ++state.transitions;
        snapshot = state;
    }

    WEATHER_INFO("Region " + region + " weather set to " + type);
    if (previous != type) {
        announce(snapshot, previous);
    }
}

void WeatherController::announce(const RegionWeather& state, const std::string& previous) const
{
    auto event = std::make_shared<WeatherEvent>(state.region, previous, state.type,
                                                state.intensity);
    event->setMessage(std::string(changeMessage(state.type)));
    EventManager::Instance().dispatchEvent(event, EventManager::DispatchMode::Deferred);
}

std::string WeatherController::getOverlay(const std::string& roomId, double now)
{
    const auto* room = ContentRegistry::Instance().getRoom(roomId);
    if (!room || room->region.empty() || room->exposure == Exposure::Indoor) {
        return {};
    }
    RegionWeather state = resolveRegion(room->region, now);
    return std::string(overlayText(state.type, room->exposure));
}

WeatherModifiers WeatherController::getModifiers(const std::string& roomId, double now)
{
    const auto* room = ContentRegistry::Instance().getRoom(roomId);
    if (!room || room->region.empty() || room->exposure == Exposure::Indoor) {
        return {};
    }
    RegionWeather state = resolveRegion(room->region, now);
    return modifiersFor(state.type, state.intensity, room->exposure);
}

WeatherModifiers WeatherController::modifiersFor(std::string_view type, int intensity,
                                                 Exposure exposure)
{
    WeatherModifiers mods;
    if (exposure == Exposure::Indoor) {
        return mods;
    }

    float scale = static_cast<float>(std::clamp(intensity, 0, MAX_INTENSITY) + 1) / 4.0f;
    if (type == "fog") {
        mods.farRangedAccuracy = -static_cast<int>(15.0f * scale);
    } else if (type == "squall") {
        mods.disengagePenalty = static_cast<int>(20.0f * scale);
    } else if (type == "salt_rain") {
        mods.extraWearChance = scale;
    } else if (type == "cold_snap" &&
               (exposure == Exposure::Outdoor || exposure == Exposure::Coastal)) {
        mods.staminaDrain = static_cast<int>(2.0f * scale);
    }
    return mods;
}

std::string_view WeatherController::changeMessage(std::string_view type)
{
    if (type == "clear") return "The sky clears.";
    if (type == "fog") return "A fog creeps in and thickens.";
    if (type == "wind") return "The wind picks up.";
    if (type == "squall") return "A squall blows in.";
    if (type == "cold_snap") return "A bitter cold settles over everything.";
    if (type == "salt_rain") return "Salt rain starts to fall.";
    return "The weather turns.";
}

std::string_view WeatherController::overlayText(std::string_view type, Exposure exposure)
{
    if (exposure == Exposure::Indoor) {
        return {};
    }
    const bool sheltered = exposure == Exposure::Sheltered;
    const bool coastal = exposure == Exposure::Coastal;

    if (type == "clear") {
        return sheltered ? "Clear sky shows beyond the shelter."
             : coastal   ? "The water lies calm under a clear sky."
                         : "The air is still and clear.";
    }
    if (type == "fog") {
        return sheltered ? "Fog drifts by outside, greying everything."
             : coastal   ? "Sea fog hangs over the water, cold and wet."
                         : "Fog muffles every sound and hides anything far off.";
    }
    if (type == "wind") {
        return sheltered ? "Wind whistles past the shelter."
             : coastal   ? "Wind rips off the water, sharp with salt."
                         : "A steady wind tugs at cloth and branches.";
    }
    if (type == "squall") {
        return sheltered ? "A squall hammers at the world outside."
             : coastal   ? "Spray and rain sting as a squall lashes the shore."
                         : "Driving rain and wind cut the view short.";
    }
    if (type == "cold_snap") {
        return sheltered ? "The cold creeps in despite the shelter."
             : coastal   ? "A bitter wind comes in off the water."
                         : "The cold bites; every breath steams.";
    }
    if (type == "salt_rain") {
        return sheltered ? "Salt rain drums on the shelter."
             : coastal   ? "Salt rain and spray pelt the shore."
                         : "Salt rain stings skin and pits metal.";
    }
    return {};
}

size_t WeatherController::getRegionCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_regions.size();
}
