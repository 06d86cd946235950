// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "session_report.pb.h"
#include "supervisor/session/session_supervisor.hpp"

#include <string>

namespace flyin::report {

flyin::SessionReport to_proto(const session::SessionResult &result, const std::string &container_image);

// Binary protobuf, written to path.tmp and renamed. Returns false (and logs) on failure.
bool write_report(const std::string &path, const session::SessionResult &result, const std::string &container_image);

// Reads a report back (tooling and tests). Returns false if missing or unparsable.
bool read_report(const std::string &path, flyin::SessionReport &out);

} // namespace flyin::report
