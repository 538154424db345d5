/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MOCK_PERSISTENCE_SERVICE_HPP
#define MOCK_PERSISTENCE_SERVICE_HPP

#include "managers/PersistenceGateway.hpp"
#include <deque>
#include <initializer_list>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @brief In-memory IPersistenceService with scripted save failures
 *
 * Queued save results are consumed one per saveCharacter call; once the
 * queue is empty every save uses defaultSaveResult.
 */
class MockPersistenceService : public IPersistenceService {
public:
    bool validateAccount(const std::string& accountName, const std::string& credential) override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (throwOnValidate) {
            throw std::runtime_error("account service offline");
        }
        auto it = credentials.find(accountName);
        return it != credentials.end() && it->second == credential;
    }

    std::optional<CharacterSheet> loadCharacter(const std::string& accountName) override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (throwOnLoad) {
            throw std::runtime_error("character store offline");
        }
        auto it = stored.find(accountName);
        if (it == stored.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool saveCharacter(const CharacterSheet& sheet) override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        saveCalls.push_back(sheet);
        if (throwOnSave) {
            throw std::runtime_error("disk full");
        }
        bool ok = defaultSaveResult;
        if (!m_saveResults.empty()) {
            ok = m_saveResults.front();
            m_saveResults.pop_front();
        }
        if (ok) {
            stored[sheet.accountName] = sheet;
        }
        return ok;
    }

    void queueSaveResults(std::initializer_list<bool> results)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_saveResults.insert(m_saveResults.end(), results.begin(), results.end());
    }

    size_t saveCallCount() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return saveCalls.size();
    }

    std::map<std::string, std::string> credentials;
    std::map<std::string, CharacterSheet> stored;
    std::vector<CharacterSheet> saveCalls;
    bool defaultSaveResult{true};
    bool throwOnValidate{false};
    bool throwOnLoad{false};
    bool throwOnSave{false};

private:
    mutable std::mutex m_mutex;
    std::deque<bool> m_saveResults;
};

#endif // MOCK_PERSISTENCE_SERVICE_HPP
