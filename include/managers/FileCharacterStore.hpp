/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef FILE_CHARACTER_STORE_HPP
#define FILE_CHARACTER_STORE_HPP

#include "managers/PersistenceGateway.hpp"
#include <mutex>
#include <string>

/**
 * @brief Character sheets as one binary file per account under a directory.
 *
 * File layout: "ANCHORCH" signature, format version, then the sheet
 * fields. Writes go to a temporary file that replaces the old one, so a
 * crash mid-write leaves the previous sheet intact.
 *
 * Accounts are accepted by name shape only (3-16 letters, digits or '_');
 * credentials belong to whatever fronts the server.
 */
class FileCharacterStore : public IPersistenceService {
public:
    static constexpr uint32_t FORMAT_VERSION = 1;

    explicit FileCharacterStore(std::string directory);

    bool validateAccount(const std::string& accountName, const std::string& credential) override;
    std::optional<CharacterSheet> loadCharacter(const std::string& accountName) override;
    bool saveCharacter(const CharacterSheet& sheet) override;

    [[nodiscard]] bool exists(const std::string& accountName) const;
    [[nodiscard]] const std::string& getDirectory() const { return m_directory; }

    static bool isValidAccountName(const std::string& accountName);

private:
    bool ensureDirectoryExists() const;
    std::string pathFor(const std::string& accountName) const;

    std::string m_directory;
    std::mutex m_fileMutex;
};

#endif // FILE_CHARACTER_STORE_HPP
