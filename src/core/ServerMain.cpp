/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/Logger.hpp"
#include "core/MudRuntime.hpp"
#include "core/ServerLoop.hpp"
#include "managers/FileCharacterStore.hpp"
#include "managers/SettingsManager.hpp"
#include "world/JsonContentSource.hpp"
#include <SDL3/SDL.h>
#include <memory>
#include <string>

const std::string SERVER_NAME{"AnchorMud"};
const std::string DEFAULT_CONFIG{"config/runtime.json"};
const std::string DEFAULT_CONTENT{"content/world.json"};

int main(int argc, char* argv[]) {
  const std::string configPath = argc > 1 ? argv[1] : DEFAULT_CONFIG;
  const std::string contentPath = argc > 2 ? argv[2] : DEFAULT_CONTENT;

  SDL_SetAppMetadata(SERVER_NAME.c_str(), "1.0", "com.hammerforged.anchormud");

  // Events only: SDL turns SIGINT/SIGTERM into SDL_EVENT_QUIT for us
  if (!SDL_Init(SDL_INIT_EVENTS)) {
    SERVER_CRITICAL("SDL_Init failed: " + std::string(SDL_GetError()));
    return -1;
  }

  std::string dataDir = "./";
  if (char* prefPath = SDL_GetPrefPath("HammerForged", SERVER_NAME.c_str())) {
    dataDir = prefPath;
    SDL_free(prefPath);
  } else {
    SERVER_WARN("No preference path (" + std::string(SDL_GetError()) +
                "), using the working directory");
  }
  AnchorMud::Logger::SetLogDirectory(dataDir + "logs");
  SERVER_INFO("Starting " + SERVER_NAME + ", data in " + dataDir);

  auto& settingsManager = AnchorMud::SettingsManager::Instance();
  if (!settingsManager.loadFromFile(configPath)) {
    SERVER_WARN("Failed to load " + configPath + " - using defaults");
  } else {
    SERVER_INFO("Settings loaded from " + configPath);
  }
  settingsManager.applyDefaults();
  const AnchorMud::RuntimeSettings settings = settingsManager.snapshot();
  const float tickRate = settingsManager.get<float>("server", "tick_rate", 10.0f);

  JsonContentSource content(contentPath);
  auto store = std::make_shared<FileCharacterStore>(dataDir + "characters");

  MudRuntime& runtime = MudRuntime::Instance();
  if (!runtime.init(settings, content, store)) {
    SERVER_CRITICAL("Init " + SERVER_NAME + " failed");
    // Partially initialized managers must be torn down before static destruction
    runtime.clean();
    SDL_Quit();
    return -1;
  }

  // The session layer attaches its own sink; until then output goes to the log
  runtime.setOutputSink([](EntityHandle recipient, const std::string& text) {
    SERVER_DEBUG(recipient.toString() + " <- " + text);
  });

  ServerLoop loop(tickRate);
  loop.setPollHandler([&loop]() {
    SDL_Event event;
    while (SDL_PollEvent(&event)) {
      if (event.type == SDL_EVENT_QUIT || event.type == SDL_EVENT_TERMINATING) {
        SERVER_INFO("Shutdown requested");
        loop.stop();
      }
    }
  });
  loop.setUpdateHandler([&runtime](float deltaTime) { runtime.update(deltaTime); });

  const bool ok = loop.run();

  SERVER_INFO("Cleaning up " + SERVER_NAME);
  runtime.clean();
  SDL_Quit();
  return ok ? 0 : -1;
}
