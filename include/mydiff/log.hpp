#pragma once

#include <mydiff/common.hpp>

#include <span>
#include <string>

namespace mydiff {

/*
 * Append-only event log, one JSON object per line.
 *
 * The file is named after the launch time and lives in the logs directory
 * of the project configuration, or of the user configuration when the
 * working directory is not inside a project.
 */
class Log {
public:
    static void log(std::span<StringViewPair const> fields);

    // Path of the file this process logs to.
    static std::string const& path();
};

} // namespace mydiff
