/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef WEATHER_CONTROLLER_HPP
#define WEATHER_CONTROLLER_HPP

/**
 * @file WeatherController.hpp
 * @brief Regional weather, resolved lazily on room access
 *
 * Every region has exactly one weather record. A record only transitions
 * when a room of its region is accessed at or after its next-change time,
 * so nothing is simulated while nobody looks. The next type comes from a
 * weighted table keyed by the current type; each draw is seeded from the
 * region seed and the transition count, which makes a region's weather
 * history reproducible for a given seed.
 *
 * Event flow:
 *   PresenceEvent(Entered) or MudRuntime::renderRoom()
 *     -> WeatherController::resolveRegion()
 *     -> WeatherEvent (Deferred) when the type changed
 */

#include "controllers/ControllerBase.hpp"
#include "core/RuntimeSettings.hpp"
#include "world/WorldData.hpp"
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace AnchorMud {
class DiceRoller;
}

struct RegionWeather {
    std::string region;
    std::string type{"clear"};
    int intensity{0};               // 0..3
    double startedAt{0.0};
    double nextChangeAt{0.0};
    uint64_t seed{0};
    uint64_t transitions{0};
};

/**
 * @brief Combat-facing effects of the weather in one room.
 * All zero for indoor rooms and for harmless weather.
 */
struct WeatherModifiers {
    int farRangedAccuracy{0};    // Added to accuracy of far-band attacks (<= 0)
    int disengagePenalty{0};     // Added to the disengage difficulty
    float extraWearChance{0.0f}; // Chance per hit of one extra point of wear
    int staminaDrain{0};         // Stamina lost per round

    [[nodiscard]] bool any() const {
        return farRangedAccuracy != 0 || disengagePenalty != 0 ||
               extraWearChance > 0.0f || staminaDrain != 0;
    }
};

class WeatherController : public ControllerBase
{
public:
    explicit WeatherController(const AnchorMud::RuntimeSettings& settings = {});
    ~WeatherController() override = default;

    /**
     * @brief Resolve weather for the region of every room a player enters
     */
    void subscribe() override;

    [[nodiscard]] std::string_view getName() const override { return "WeatherController"; }

    /**
     * @brief Replace the transition tables. Rows with no positive weight
     * are dropped; a type with no row falls back to clear.
     */
    void setTransitionTable(const AnchorMud::WeatherTransitionTable& table);

    /**
     * @brief Current record for a region, creating it on first sight.
     * Transitions if now is at or past its next-change time.
     */
    RegionWeather resolveRegion(const std::string& region, double now);

    /**
     * @brief resolveRegion() for the region of a room.
     * @return nullopt for unknown rooms or rooms without a region
     */
    std::optional<RegionWeather> resolveForRoom(const std::string& roomId, double now);

    /**
     * @brief Read the record without transitioning it
     */
    [[nodiscard]] std::optional<RegionWeather> peekRegion(const std::string& region) const;

    /**
     * @brief Force a region's weather (admin command). Dispatches a
     * WeatherEvent if the type changed.
     */
    void setWeather(const std::string& region, const std::string& type, int intensity,
                    double now);

    /**
     * @brief One-line weather description for a room, empty when indoor.
     */
    std::string getOverlay(const std::string& roomId, double now);

    WeatherModifiers getModifiers(const std::string& roomId, double now);

    [[nodiscard]] size_t getRegionCount() const;

    /**
     * @brief Pick the next type from a weighted row.
     */
    static std::string rollNextWeather(const AnchorMud::WeatherWeights& row,
                                       AnchorMud::DiceRoller& roller);

    static const AnchorMud::WeatherTransitionTable& defaultTransitions();
    static std::string_view changeMessage(std::string_view type);
    static std::string_view overlayText(std::string_view type, AnchorMud::Exposure exposure);
    static WeatherModifiers modifiersFor(std::string_view type, int intensity,
                                         AnchorMud::Exposure exposure);

private:
    void onPresenceEvent(const EventData& data);

    // Caller holds m_mutex
    RegionWeather& findOrCreate(const std::string& region, double now);
    std::optional<std::string> transition(RegionWeather& state, double now);
    double rollDuration(AnchorMud::DiceRoller& roller) const;

    void announce(const RegionWeather& state, const std::string& previous) const;

    AnchorMud::RuntimeSettings m_settings;
    AnchorMud::WeatherTransitionTable m_transitions;

    mutable std::mutex m_mutex;
    std::unordered_map<std::string, RegionWeather> m_regions;
};

#endif // WEATHER_CONTROLLER_HPP
