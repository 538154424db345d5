/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PERSISTENCE_GATEWAY_HPP
#define PERSISTENCE_GATEWAY_HPP

/**
 * @file PersistenceGateway.hpp
 * @brief The one door between the runtime and account/character storage
 *
 * Account checks and character loads are synchronous request/response
 * calls made while connecting, never under a room lock. Saves are
 * deferred: queueSave() records the latest sheet per character and returns
 * immediately; a Low priority worker task performs the write. A failed
 * write (false or an exception from the service) is retried with
 * exponential backoff and dropped after persistence.max_retries.
 *
 * Nothing in combat ever waits on this class.
 */

#include "core/RuntimeSettings.hpp"
#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief What survives a logout
 */
struct CharacterSheet {
    std::string accountName;
    std::string characterName;
    std::string roomId;
    int hpCurrent{20};
    int hpMax{20};
    int staminaCurrent{10};
    int staminaMax{10};
    int accuracy{55};
    int avoidance{40};
    int initiativeBonus{0};
    std::string weaponItem;        // Item template id, empty when unarmed
    int weaponDurability{0};
    std::vector<std::string> armorItems;
    std::vector<std::string> maneuvers;
    std::vector<std::string> inventory;
};

enum class LoadStatus : uint8_t {
    Found,
    NotFound,      // The account has never saved a character
    Unavailable    // The store failed; nothing is known about the account
};

struct CharacterLoad {
    LoadStatus status{LoadStatus::NotFound};
    std::optional<CharacterSheet> sheet;

    [[nodiscard]] bool found() const { return status == LoadStatus::Found && sheet.has_value(); }
    [[nodiscard]] bool unavailable() const { return status == LoadStatus::Unavailable; }
};

/**
 * @brief External account and character storage
 */
class IPersistenceService {
public:
    virtual ~IPersistenceService() = default;

    virtual bool validateAccount(const std::string& accountName, const std::string& credential) = 0;

    /**
     * @return The stored sheet, or nullopt when the account has none yet
     * @throws std::runtime_error when the store cannot answer
     */
    virtual std::optional<CharacterSheet> loadCharacter(const std::string& accountName) = 0;

    virtual bool saveCharacter(const CharacterSheet& sheet) = 0;
};

class PersistenceGateway {
public:
    static PersistenceGateway& Instance() {
        static PersistenceGateway instance;
        return instance;
    }

    bool init(std::shared_ptr<IPersistenceService> service,
              const AnchorMud::RuntimeSettings& settings = {});
    void clean();
    [[nodiscard]] bool isInitialized() const { return m_initialized.load(std::memory_order_acquire); }

    /**
     * @brief Synchronous account check. Service failures count as rejection.
     */
    bool validateAccount(const std::string& accountName, const std::string& credential);

    /**
     * @brief Synchronous load. A service failure (exception or no service)
     * comes back as Unavailable, never as NotFound: only NotFound may be
     * answered with a fresh character.
     */
    CharacterLoad loadCharacter(const std::string& accountName);

    /**
     * @brief Defer a save. A newer sheet for the same account replaces a
     * pending one and resets its retry count.
     */
    void queueSave(const CharacterSheet& sheet);

    /**
     * @brief Dispatch writes that are due (server tick)
     * @param now Seconds on the gateway's own clock (steady time in the
     * server, scripted in tests)
     * @return Writes started
     */
    size_t update(double now);

    /**
     * @brief Attempt every pending write now, inline, ignoring backoff
     * (shutdown path)
     * @return Writes still pending afterwards
     */
    size_t flush();

    [[nodiscard]] size_t getPendingCount() const;
    [[nodiscard]] uint64_t getCompletedCount() const { return m_completed.load(); }
    [[nodiscard]] uint64_t getDroppedCount() const { return m_dropped.load(); }
    [[nodiscard]] uint64_t getFailedAttemptCount() const { return m_failedAttempts.load(); }

    /**
     * @brief Delay before attempt number `attempt` (1-based retry count)
     */
    [[nodiscard]] double backoffFor(int attempt) const;

    /**
     * @brief Seconds on the steady clock, the server's time base for update()
     */
    static double steadyNow();

private:
    struct PendingWrite {
        CharacterSheet sheet;
        int attempts{0};
        double nextAttemptAt{0.0};
        bool inFlight{false};
        uint64_t generation{0};
    };

    PersistenceGateway() = default;
    ~PersistenceGateway() = default;
    PersistenceGateway(const PersistenceGateway&) = delete;
    PersistenceGateway& operator=(const PersistenceGateway&) = delete;

    bool attemptWrite(const CharacterSheet& sheet);
    void finishWrite(const std::string& accountName, uint64_t generation, bool ok, double now);

    std::shared_ptr<IPersistenceService> m_service;
    AnchorMud::RuntimeSettings m_settings;
    std::atomic<bool> m_initialized{false};

    mutable std::mutex m_mutex;
    std::map<std::string, PendingWrite> m_pending;
    uint64_t m_nextGeneration{1};
    double m_lastNow{0.0};

    std::atomic<uint64_t> m_completed{0};
    std::atomic<uint64_t> m_dropped{0};
    std::atomic<uint64_t> m_failedAttempts{0};
};

#endif // PERSISTENCE_GATEWAY_HPP
