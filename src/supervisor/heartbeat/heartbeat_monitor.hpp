// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace flyin::hb {

using wall_clock = std::chrono::system_clock;
using clock_fn = std::function<wall_clock::time_point()>;

// File-backed last-activity record shared between the connection tracker (writer) and the
// idle watchdog (reader). The file holds one decimal value: milliseconds since the Unix epoch.
class HeartbeatMonitor
{
public:
    explicit HeartbeatMonitor(std::string path, clock_fn clock = {});

    // Overwrites the record with the current time (temp file + rename, so readers never see a torn value).
    // Returns false and logs when the file cannot be written.
    bool record_activity() const;

    // Elapsed time since the last recorded activity or the idle clock start, whichever is later, so a
    // fresh session (or a stale record from an earlier one) counts as active. Unreadable or malformed
    // records count as active (zero).
    std::chrono::milliseconds time_since_last_activity() const;

    // nullopt when there is no record or it cannot be parsed.
    std::optional<wall_clock::time_point> last_activity() const;

    // Moves the idle clock start to now. Not synchronized with readers: call before the watchdog starts.
    void restart_idle_clock();

    const std::string &path() const noexcept { return m_path; }
    wall_clock::time_point started_at() const noexcept { return m_started_at; }

private:
    enum class read_status
    {
        ok,
        missing,
        invalid
    };
    read_status read_record(wall_clock::time_point &out, std::string &detail) const;

    std::string m_path;
    clock_fn m_clock;
    wall_clock::time_point m_started_at;
};

// Writes a single heartbeat for the given path; used by the CLI's --record-activity.
bool record_activity_at(const std::string &path);

} // namespace flyin::hb
