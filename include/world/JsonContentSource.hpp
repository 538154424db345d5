/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef JSON_CONTENT_SOURCE_HPP
#define JSON_CONTENT_SOURCE_HPP

/**
 * @file JsonContentSource.hpp
 * @brief Reads content templates from one JSON document
 *
 * Top-level arrays: rooms, items, creatures, npcs, maneuvers, loot_tables,
 * encounters, regions, schedules. Top-level object: weather_transitions.
 * Unknown keys on a template are kept in its extensions map when they are
 * strings or numbers.
 */

#include "managers/ContentRegistry.hpp"
#include <string>
#include <utility>

namespace AnchorMud {
class JsonValue;
}

class JsonContentSource : public IContentSource {
public:
    explicit JsonContentSource(std::string path) : m_path(std::move(path)) {}

    bool load(ContentBundle& out) override;

    /**
     * @brief Load from an in-memory document instead of the file
     */
    static bool loadFromString(const std::string& json, ContentBundle& out);

    [[nodiscard]] std::string describe() const override { return m_path; }

private:
    static bool readDocument(const AnchorMud::JsonValue& root, ContentBundle& out);

    std::string m_path;
};

#endif // JSON_CONTENT_SOURCE_HPP
