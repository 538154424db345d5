/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

// Release builds only: debug builds print to stdout from the header
#ifndef DEBUG

#include "core/Logger.hpp"

#include <algorithm>
#include <chrono>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

namespace AnchorMud {
namespace {

namespace fs = std::filesystem;

constexpr const char* LOG_PREFIX = "anchormud_";
constexpr size_t MAX_KEPT_FILES = 5;
constexpr size_t FLUSH_EVERY = 50;

std::tm localTime(std::chrono::system_clock::time_point when) {
    const auto seconds = std::chrono::system_clock::to_time_t(when);
    std::tm out{};
    localtime_r(&seconds, &out);
    return out;
}

/**
 * Rotating sink for CRITICAL and ERROR lines. Opens lazily on the first
 * write so a server that never errors never touches the disk.
 */
class RotatingLogFile {
public:
    static RotatingLogFile& Instance() {
        static RotatingLogFile instance;
        return instance;
    }

    void setDirectory(const std::string& directory) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_opened) {
            m_directory = directory;
        }
    }

    void append(const char* level, const char* system, const char* message) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_opened) {
            open();
        }
        if (!m_out.is_open()) {
            return;
        }

        const auto now = std::chrono::system_clock::now();
        const std::tm stamp = localTime(now);
        const auto millis =
            std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() %
            1000;

        m_out << std::put_time(&stamp, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0')
              << std::setw(3) << millis << ' ' << level << " [" << system << "] " << message
              << '\n';

        if (++m_unflushed >= FLUSH_EVERY || std::strcmp(level, "CRITICAL") == 0) {
            m_out.flush();
            m_unflushed = 0;
        }
    }

private:
    RotatingLogFile() = default;
    ~RotatingLogFile() {
        if (m_out.is_open()) {
            m_out.flush();
        }
    }
    RotatingLogFile(const RotatingLogFile&) = delete;
    RotatingLogFile& operator=(const RotatingLogFile&) = delete;

    void open() {
        m_opened = true;

        const fs::path dir = m_directory.empty() ? fs::path("logs") : fs::path(m_directory);
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            return;
        }
        // Make room for the file about to be created
        pruneOldFiles(dir, MAX_KEPT_FILES - 1);

        const std::tm started = localTime(std::chrono::system_clock::now());
        std::ostringstream name;
        name << LOG_PREFIX << std::put_time(&started, "%Y%m%d_%H%M%S") << ".log";

        m_out.open(dir / name.str(), std::ios::out | std::ios::app);
        if (m_out.is_open()) {
            m_out << "# AnchorMud server log, started "
                  << std::put_time(&started, "%Y-%m-%d %H:%M:%S") << "\n";
            m_out.flush();
        }
    }

    static void pruneOldFiles(const fs::path& dir, size_t keep) {
        std::vector<fs::directory_entry> logs;
        std::error_code ec;
        for (const auto& entry : fs::directory_iterator(dir, ec)) {
            const std::string file = entry.path().filename().string();
            if (entry.path().extension() == ".log" && file.rfind(LOG_PREFIX, 0) == 0) {
                logs.push_back(entry);
            }
        }
        if (logs.size() <= keep) {
            return;
        }

        std::sort(logs.begin(), logs.end(),
                  [](const fs::directory_entry& a, const fs::directory_entry& b) {
                      return a.last_write_time() < b.last_write_time();
                  });
        const size_t excess = logs.size() - keep;
        for (size_t i = 0; i < excess; ++i) {
            fs::remove(logs[i].path(), ec);
        }
    }

    std::mutex m_mutex;
    std::ofstream m_out;
    std::string m_directory;
    bool m_opened{false};
    size_t m_unflushed{0};
};

} // namespace

void Logger::SetLogDirectory(const std::string& directory) {
    RotatingLogFile::Instance().setDirectory(directory);
}

void Logger::writeToFile(const char* level, const char* system, const char* message) {
    RotatingLogFile::Instance().append(level, system, message);
}

} // namespace AnchorMud

#endif // ifndef DEBUG
