/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/PersistenceGateway.hpp"
#include "core/Logger.hpp"
#include "core/ThreadSystem.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>

namespace {
constexpr double MAX_BACKOFF_SECONDS = 300.0;
}

bool PersistenceGateway::init(std::shared_ptr<IPersistenceService> service,
                              const AnchorMud::RuntimeSettings& settings)
{
    if (!service) {
        PERSIST_ERROR("No persistence service supplied");
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_service = std::move(service);
    m_settings = settings;
    m_pending.clear();
    m_completed.store(0);
    m_dropped.store(0);
    m_failedAttempts.store(0);
    m_lastNow = 0.0;
    m_initialized.store(true, std::memory_order_release);
    PERSIST_INFO("PersistenceGateway initialized (max retries " +
                 std::to_string(m_settings.maxRetries) + ")");
    return true;
}

void PersistenceGateway::clean()
{
    if (!m_initialized.load(std::memory_order_acquire)) {
        return;
    }

    const size_t left = flush();
    if (left > 0) {
        PERSIST_ERROR("Shutting down with " + std::to_string(left) + " unsaved character(s)");
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_pending.clear();
    m_service.reset();
    m_initialized.store(false, std::memory_order_release);
}

double PersistenceGateway::steadyNow()
{
    using namespace std::chrono;
    return duration<double>(steady_clock::now().time_since_epoch()).count();
}

double PersistenceGateway::backoffFor(int attempt) const
{
    const double delay = m_settings.retryBaseSeconds * std::pow(2.0, std::max(0, attempt - 1));
    return std::min(delay, MAX_BACKOFF_SECONDS);
}

bool PersistenceGateway::validateAccount(const std::string& accountName,
                                         const std::string& credential)
{
    if (!m_service) {
        PERSIST_ERROR("Account check without a persistence service");
        return false;
    }
    try {
        return m_service->validateAccount(accountName, credential);
    } catch (const std::exception& e) {
        PERSIST_ERROR("Account check for " + accountName + " failed: " + std::string(e.what()));
        return false;
    }
}

CharacterLoad PersistenceGateway::loadCharacter(const std::string& accountName)
{
    CharacterLoad result;
    if (!m_service) {
        PERSIST_ERROR("Character load without a persistence service");
        result.status = LoadStatus::Unavailable;
        return result;
    }
    try {
        result.sheet = m_service->loadCharacter(accountName);
        result.status = result.sheet ? LoadStatus::Found : LoadStatus::NotFound;
    } catch (const std::exception& e) {
        PERSIST_ERROR("Loading " + accountName + " failed: " + std::string(e.what()));
        result.status = LoadStatus::Unavailable;
    }
    return result;
}

void PersistenceGateway::queueSave(const CharacterSheet& sheet)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    PendingWrite& entry = m_pending[sheet.accountName];
    entry.sheet = sheet;
    entry.attempts = 0;
    entry.nextAttemptAt = m_lastNow;
    entry.generation = m_nextGeneration++;
    PERSIST_DEBUG("Queued save for " + sheet.accountName);
}

bool PersistenceGateway::attemptWrite(const CharacterSheet& sheet)
{
    if (!m_service) {
        return false;
    }
    try {
        return m_service->saveCharacter(sheet);
    } catch (const std::exception& e) {
        PERSIST_ERROR("Saving " + sheet.accountName + " threw: " + std::string(e.what()));
        return false;
    }
}

void PersistenceGateway::finishWrite(const std::string& accountName, uint64_t generation, bool ok,
                                     double now)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_pending.find(accountName);
    if (it == m_pending.end()) {
        return;
    }
    PendingWrite& entry = it->second;
    entry.inFlight = false;

    if (entry.generation != generation) {
        // A newer sheet arrived while this one was being written
        if (ok) {
            m_completed.fetch_add(1, std::memory_order_relaxed);
        }
        return;
    }

    if (ok) {
        m_completed.fetch_add(1, std::memory_order_relaxed);
        m_pending.erase(it);
        PERSIST_DEBUG("Saved " + accountName);
        return;
    }

    m_failedAttempts.fetch_add(1, std::memory_order_relaxed);
    ++entry.attempts;
    if (entry.attempts > m_settings.maxRetries) {
        PERSIST_ERROR("Giving up on saving " + accountName + " after " +
                      std::to_string(entry.attempts) + " attempt(s)");
        m_dropped.fetch_add(1, std::memory_order_relaxed);
        m_pending.erase(it);
        return;
    }

    entry.nextAttemptAt = now + backoffFor(entry.attempts);
    PERSIST_WARN("Save of " + accountName + " failed, retry " + std::to_string(entry.attempts) +
                 " in " + std::to_string(backoffFor(entry.attempts)) + "s");
}

size_t PersistenceGateway::update(double now)
{
    struct Job {
        CharacterSheet sheet;
        uint64_t generation;
    };
    std::vector<Job> due;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_lastNow = now;
        for (auto& [account, entry] : m_pending) {
            if (!entry.inFlight && entry.nextAttemptAt <= now) {
                entry.inFlight = true;
                due.push_back(Job{entry.sheet, entry.generation});
            }
        }
    }

    for (auto& job : due) {
        auto task = [this, job, now]() {
            const bool ok = attemptWrite(job.sheet);
            finishWrite(job.sheet.accountName, job.generation, ok, now);
        };
        if (AnchorMud::ThreadSystem::Exists()) {
            AnchorMud::ThreadSystem::Instance().enqueueTask(task, AnchorMud::TaskPriority::Low,
                                                             "character save");
        } else {
            task();
        }
    }
    return due.size();
}

size_t PersistenceGateway::flush()
{
    std::vector<std::pair<CharacterSheet, uint64_t>> jobs;
    double now = 0.0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        now = m_lastNow;
        for (auto& [account, entry] : m_pending) {
            if (!entry.inFlight) {
                entry.inFlight = true;
                jobs.emplace_back(entry.sheet, entry.generation);
            }
        }
    }

    for (const auto& [sheet, generation] : jobs) {
        finishWrite(sheet.accountName, generation, attemptWrite(sheet), now);
    }
    return getPendingCount();
}

size_t PersistenceGateway::getPendingCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pending.size();
}
