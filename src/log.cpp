#include <mydiff/log.hpp>
#include <mydiff/configuration.hpp>

#include <boost/json.hpp>

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace mydiff {

static std::tm & launch_time()
{
    static struct LaunchTime : public std::tm
    {
        LaunchTime()
        {
            auto now = std::chrono::system_clock::now();
            std::time_t now_time_t = std::chrono::system_clock::to_time_t(now);
            gmtime_r(&now_time_t, this);
        }
    } launch_tm;
    return launch_tm;
}

static std::string log_path()
{
    std::stringstream logfn_ss;
    logfn_ss << std::put_time(&launch_time(), "%FT%TZ.log");
    std::string_view subpath[] = {"logs", logfn_ss.view()};
    try {
        return Configuration::path_local(subpath);
    } catch (std::invalid_argument const&) {
        // not inside a project
        return Configuration::path_user(subpath);
    }
}

static std::ofstream & logf()
{
    static struct LogStream : public std::ofstream
    {
        LogStream()
        {
            open(Log::path(), std::ios::app);
            if (!is_open()) {
                throw std::runtime_error("cannot open log file " + Log::path());
            }
        }
    } logf;
    return logf;
}

std::string const& Log::path()
{
    static std::string const path = log_path();
    return path;
}

void Log::log(std::span<StringViewPair const> fields)
{
    boost::json::object obj;

    auto now = std::chrono::system_clock::now();
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();

    for (auto&& [key, value] : fields) {
        obj[key] = value;
    }

    obj["ts"] = (double)now_ms / 1000.0;

    logf() << obj << std::endl;
}

static struct EnsureLaunchTimeCreated
{
    EnsureLaunchTimeCreated()
    { launch_time(); }
} ensure_launchtime_created;

} // namespace mydiff
