/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOOT_EVENT_HPP
#define LOOT_EVENT_HPP

/**
 * @file LootEvent.hpp
 * @brief Result of one loot table roll (death drop or room loot rule)
 */

#include "events/Event.hpp"
#include <string>
#include <utility>
#include <vector>

class LootEvent : public Event {
public:
    LootEvent(EntityHandle source, std::string sourceName, std::string lootTableId)
        : m_source(source), m_sourceName(std::move(sourceName)),
          m_lootTableId(std::move(lootTableId)) {}

    void execute() override {}
    void reset() override {
        m_items.clear();
        m_itemNames.clear();
    }

    std::string getName() const override { return "LootEvent"; }
    std::string getType() const override { return "Loot"; }
    std::string getTypeName() const override { return "LootEvent"; }
    EventTypeId getTypeId() const override { return EventTypeId::Loot; }

    std::string getMessage() const override {
        if (m_itemNames.empty()) {
            return m_sourceName + " leaves nothing of value.";
        }
        std::string text = m_sourceName + " drops ";
        for (size_t i = 0; i < m_itemNames.size(); ++i) {
            if (i > 0) {
                text += (i + 1 == m_itemNames.size()) ? " and " : ", ";
            }
            text += m_itemNames[i];
        }
        return text + ".";
    }

    void addItem(EntityHandle item, std::string name) {
        m_items.push_back(item);
        m_itemNames.push_back(std::move(name));
    }

    [[nodiscard]] EntityHandle getSource() const { return m_source; }
    [[nodiscard]] const std::string& getLootTableId() const { return m_lootTableId; }
    [[nodiscard]] const std::vector<EntityHandle>& getItems() const { return m_items; }

private:
    EntityHandle m_source;
    std::string m_sourceName;
    std::string m_lootTableId;
    std::vector<EntityHandle> m_items;
    std::vector<std::string> m_itemNames;
};

#endif // LOOT_EVENT_HPP
