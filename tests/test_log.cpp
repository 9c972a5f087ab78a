#define BOOST_TEST_MAIN
#include <boost/test/unit_test.hpp>

#include <mydiff/log.hpp>

#include <boost/json.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include <unistd.h>

namespace fs = std::filesystem;

// The log file is chosen once per process, so every case shares one project.
struct LogProject
{
    LogProject()
    : root(fs::temp_directory_path() / ("mydiff-log-test-" + std::to_string(getpid())))
    {
        fs::create_directories(root / ".mydiff");
        fs::current_path(root);
    }

    ~LogProject()
    {
        std::error_code ignored;
        fs::current_path(fs::temp_directory_path(), ignored);
        fs::remove_all(root, ignored);
    }

    fs::path root;
};

BOOST_TEST_GLOBAL_FIXTURE(LogProject);

namespace {

fs::path logs_dir()
{
    return fs::current_path() / ".mydiff" / "logs";
}

std::vector<std::string> log_lines()
{
    std::ifstream log_stream(mydiff::Log::path());
    std::vector<std::string> lines;
    for (std::string line; std::getline(log_stream, line); ) {
        lines.emplace_back(std::move(line));
    }
    return lines;
}

} // namespace

BOOST_AUTO_TEST_SUITE(LogTest)

BOOST_AUTO_TEST_CASE(log_file_creation)
{
    mydiff::Log::log(mydiff::span<mydiff::StringViewPair>({
        {"key", "value"}
    }));

    BOOST_CHECK(fs::exists(logs_dir()));
    BOOST_CHECK(fs::exists(mydiff::Log::path()));
    BOOST_CHECK_EQUAL(fs::path(mydiff::Log::path()).parent_path(), logs_dir());
}

BOOST_AUTO_TEST_CASE(log_file_name)
{
    mydiff::Log::log(mydiff::span<mydiff::StringViewPair>({
        {"key", "value"}
    }));

    // Check that the log file name is in the correct format
    std::string log_file_name = fs::path(mydiff::Log::path()).filename().string();
    BOOST_REQUIRE(log_file_name.size() == 24); // YYYY-MM-DDTHH:MM:SSZ.log
    BOOST_CHECK(log_file_name.substr(0, 4).find_first_not_of("0123456789") == std::string::npos); // Year
    BOOST_CHECK(log_file_name.substr(4, 1) == "-");
    BOOST_CHECK(log_file_name.substr(5, 2).find_first_not_of("0123456789") == std::string::npos); // Month
    BOOST_CHECK(log_file_name.substr(7, 1) == "-");
    BOOST_CHECK(log_file_name.substr(8, 2).find_first_not_of("0123456789") == std::string::npos); // Day
    BOOST_CHECK(log_file_name.substr(10, 1) == "T");
    BOOST_CHECK(log_file_name.substr(11, 2).find_first_not_of("0123456789") == std::string::npos); // Hour
    BOOST_CHECK(log_file_name.substr(13, 1) == ":");
    BOOST_CHECK(log_file_name.substr(14, 2).find_first_not_of("0123456789") == std::string::npos); // Minute
    BOOST_CHECK(log_file_name.substr(16, 1) == ":");
    BOOST_CHECK(log_file_name.substr(17, 2).find_first_not_of("0123456789") == std::string::npos); // Second
    BOOST_CHECK(log_file_name.substr(19, 1) == "Z");
    BOOST_CHECK(log_file_name.substr(20) == ".log");
}

BOOST_AUTO_TEST_CASE(log_file_contents)
{
    mydiff::Log::log(mydiff::span<mydiff::StringViewPair>({
        {"command", "create"},
        {"ops", "3"}
    }));

    auto lines = log_lines();
    BOOST_REQUIRE(!lines.empty());
    BOOST_CHECK(lines.back().find("\"command\":\"create\"") != std::string::npos);
    BOOST_CHECK(lines.back().find("\"ops\":\"3\"") != std::string::npos);
    BOOST_CHECK(lines.back().find("\"ts\":") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(one_object_per_line)
{
    auto before = log_lines().size();

    mydiff::Log::log(mydiff::span<mydiff::StringViewPair>({
        {"file", "name with \"quotes\"\nand a newline"}
    }));
    mydiff::Log::log(mydiff::span<mydiff::StringViewPair>({
        {"key1", "value1"},
        {"key2", "value2"}
    }));

    auto lines = log_lines();
    BOOST_REQUIRE_EQUAL(lines.size(), before + 2);

    auto first = boost::json::parse(lines[before]).as_object();
    BOOST_CHECK(first.at("file").as_string() == "name with \"quotes\"\nand a newline");
    BOOST_CHECK(first.at("ts").is_double());

    auto second = boost::json::parse(lines[before + 1]).as_object();
    BOOST_CHECK(second.at("key1").as_string() == "value1");
    BOOST_CHECK(second.at("key2").as_string() == "value2");
}

BOOST_AUTO_TEST_SUITE_END()
