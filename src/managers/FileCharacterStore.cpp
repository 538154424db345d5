/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/FileCharacterStore.hpp"
#include "core/Logger.hpp"
#include "utils/BinarySerializer.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace {

using AnchorMud::BinarySerial::RecordReader;
using AnchorMud::BinarySerial::RecordWriter;

constexpr AnchorMud::BinarySerial::Signature CHARACTER_SIGNATURE{'A', 'N', 'C', 'H', 'O', 'R', 'C', 'H'};

bool writeSheet(RecordWriter& out, const CharacterSheet& sheet)
{
    return out.writeHeader(CHARACTER_SIGNATURE, FileCharacterStore::FORMAT_VERSION) &&
           out.writeString(sheet.accountName) && out.writeString(sheet.characterName) &&
           out.writeString(sheet.roomId) && out.writeI32(sheet.hpCurrent) &&
           out.writeI32(sheet.hpMax) && out.writeI32(sheet.staminaCurrent) &&
           out.writeI32(sheet.staminaMax) && out.writeI32(sheet.accuracy) &&
           out.writeI32(sheet.avoidance) && out.writeI32(sheet.initiativeBonus) &&
           out.writeString(sheet.weaponItem) && out.writeI32(sheet.weaponDurability) &&
           out.writeStringList(sheet.armorItems) && out.writeStringList(sheet.maneuvers) &&
           out.writeStringList(sheet.inventory);
}

bool readSheet(RecordReader& in, CharacterSheet& sheet)
{
    return in.readHeader(CHARACTER_SIGNATURE, FileCharacterStore::FORMAT_VERSION) &&
           in.readString(sheet.accountName) && in.readString(sheet.characterName) &&
           in.readString(sheet.roomId) && in.readI32(sheet.hpCurrent) &&
           in.readI32(sheet.hpMax) && in.readI32(sheet.staminaCurrent) &&
           in.readI32(sheet.staminaMax) && in.readI32(sheet.accuracy) &&
           in.readI32(sheet.avoidance) && in.readI32(sheet.initiativeBonus) &&
           in.readString(sheet.weaponItem) && in.readI32(sheet.weaponDurability) &&
           in.readStringList(sheet.armorItems) && in.readStringList(sheet.maneuvers) &&
           in.readStringList(sheet.inventory);
}

} // namespace

FileCharacterStore::FileCharacterStore(std::string directory) : m_directory(std::move(directory))
{
}

bool FileCharacterStore::isValidAccountName(const std::string& accountName)
{
    if (accountName.size() < 3 || accountName.size() > 16) {
        return false;
    }
    return std::all_of(accountName.begin(), accountName.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_';
    });
}

bool FileCharacterStore::validateAccount(const std::string& accountName,
                                         const std::string& credential)
{
    (void)credential;
    return isValidAccountName(accountName);
}

std::string FileCharacterStore::pathFor(const std::string& accountName) const
{
    return (std::filesystem::path(m_directory) / (accountName + ".chr")).string();
}

bool FileCharacterStore::ensureDirectoryExists() const
{
    try {
        if (std::filesystem::exists(m_directory)) {
            return std::filesystem::is_directory(m_directory);
        }
        if (std::filesystem::create_directories(m_directory)) {
            PERSIST_INFO("Created character directory: " + m_directory);
            return true;
        }
        PERSIST_ERROR("Failed to create character directory: " + m_directory);
        return false;
    } catch (const std::filesystem::filesystem_error& e) {
        PERSIST_ERROR("Error creating character directory: " + std::string(e.what()));
        return false;
    }
}

bool FileCharacterStore::exists(const std::string& accountName) const
{
    std::error_code ec;
    return isValidAccountName(accountName) && std::filesystem::exists(pathFor(accountName), ec);
}

std::optional<CharacterSheet> FileCharacterStore::loadCharacter(const std::string& accountName)
{
    if (!isValidAccountName(accountName)) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(m_fileMutex);
    const std::string path = pathFor(accountName);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::nullopt;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open " + path);
    }

    RecordReader reader(file);
    CharacterSheet sheet;
    if (!readSheet(reader, sheet)) {
        throw std::runtime_error("corrupt character file " + path);
    }
    if (sheet.accountName != accountName) {
        PERSIST_WARN("Character file " + path + " names account " + sheet.accountName);
        sheet.accountName = accountName;
    }
    return sheet;
}

bool FileCharacterStore::saveCharacter(const CharacterSheet& sheet)
{
    if (!isValidAccountName(sheet.accountName)) {
        PERSIST_ERROR("Refusing to save invalid account name '" + sheet.accountName + "'");
        return false;
    }

    std::lock_guard<std::mutex> lock(m_fileMutex);
    if (!ensureDirectoryExists()) {
        return false;
    }

    const std::string path = pathFor(sheet.accountName);
    const std::string temp = path + ".tmp";
    {
        std::ofstream file(temp, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            PERSIST_ERROR("Failed to open for writing: " + temp);
            return false;
        }
        RecordWriter writer(file);
        if (!writeSheet(writer, sheet)) {
            PERSIST_ERROR("Short write for " + sheet.accountName);
            return false;
        }
        file.flush();
        if (!file.good()) {
            return false;
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp, path, ec);
    if (ec) {
        PERSIST_ERROR("Could not replace " + path + ": " + ec.message());
        return false;
    }
    return true;
}
