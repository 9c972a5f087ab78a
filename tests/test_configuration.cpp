#define BOOST_TEST_MAIN
#include <boost/test/unit_test.hpp>

#include <mydiff/configuration.hpp>
#include <mydiff/stream.hpp>

#include "temporary_directory.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

using mydiff::Configuration;

namespace {

// Points the per-user configuration at a scratch directory for one test.
class UserConfigHome {
public:
    UserConfigHome()
    : home_("mydiff-test-home")
    {
        setenv("XDG_CONFIG_HOME", home_.path().c_str(), 1);
    }

    ~UserConfigHome() {
        unsetenv("XDG_CONFIG_HOME");
    }

    const fs::path& path() const {
        return home_.path();
    }

private:
    TemporaryDirectory home_;
};

void write_file(std::string const& path, std::string const& contents)
{
    std::ofstream file(path);
    file << contents;
}

std::string read_file(std::string const& path)
{
    std::ifstream file(path);
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

} // namespace

BOOST_AUTO_TEST_SUITE(ConfigurationTest)

BOOST_AUTO_TEST_CASE(init)
{
    UserConfigHome home;
    TemporaryDirectory temp_dir;
    fs::current_path(temp_dir.path());

    BOOST_CHECK(Configuration::init());
    BOOST_CHECK(fs::exists(".mydiff"));
    BOOST_CHECK(!Configuration::init());
}

BOOST_AUTO_TEST_CASE(path_local)
{
    UserConfigHome home;
    TemporaryDirectory temp_dir;
    fs::create_directory(temp_dir.path() / ".mydiff");
    fs::create_directories(temp_dir.path() / "nested" / "deeper");
    fs::current_path(temp_dir.path() / "nested" / "deeper");

    std::string path = Configuration::path_local();
    BOOST_CHECK_EQUAL(path, (temp_dir.path() / ".mydiff").native());
}

BOOST_AUTO_TEST_CASE(path_local_without_project)
{
    UserConfigHome home;
    TemporaryDirectory temp_dir;
    fs::current_path(temp_dir.path());

    BOOST_CHECK_THROW(Configuration::path_local(), std::invalid_argument);
    BOOST_CHECK_THROW(Configuration config, std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(path_user)
{
    UserConfigHome home;

    std::string path = Configuration::path_user();
    BOOST_CHECK_EQUAL(path, (home.path() / "mydiff").native());
}

BOOST_AUTO_TEST_CASE(path_local_subpaths)
{
    UserConfigHome home;
    TemporaryDirectory temp_dir;
    fs::create_directory(temp_dir.path() / ".mydiff");
    fs::current_path(temp_dir.path());

    std::string path = Configuration::path_local(mydiff::span<std::string_view>({"subdir", "subsubdir"}), true);
    BOOST_CHECK_EQUAL(path, (temp_dir.path() / ".mydiff" / "subdir" / "subsubdir" / "").native());
    BOOST_CHECK(fs::is_directory(path));
}

BOOST_AUTO_TEST_CASE(path_user_subpaths)
{
    UserConfigHome home;

    std::string path = Configuration::path_user(mydiff::span<std::string_view>({"logs", "today.log"}));
    BOOST_CHECK_EQUAL(path, (home.path() / "mydiff" / "logs" / "today.log").native());
    BOOST_CHECK(fs::is_directory(home.path() / "mydiff" / "logs"));
    BOOST_CHECK(!fs::exists(path));
}

BOOST_AUTO_TEST_CASE(default_to_user_parameters)
{
    UserConfigHome home;
    TemporaryDirectory temp_dir;
    fs::current_path(temp_dir.path());
    Configuration::init();

    write_file(Configuration::path_user(mydiff::span<std::string_view>({"config"})),
        "[diff]\nchunk-size = 4096\n[log]\nenabled = false\n");
    write_file(Configuration::path_local(mydiff::span<std::string_view>({"config"})),
        "[patch]\ncopy-block = 512\n[log]\nenabled = yes\n");

    Configuration config;

    // from the user file
    BOOST_CHECK_EQUAL(config.get(mydiff::span<std::string_view>({"diff", "chunk-size"}), 1), 4096u);
    // from the project file
    BOOST_CHECK_EQUAL(config.get(mydiff::span<std::string_view>({"patch", "copy-block"}), 1), 512u);
    // the project file wins
    BOOST_CHECK(config.enabled(mydiff::span<std::string_view>({"log", "enabled"})));
    // unset
    BOOST_CHECK_EQUAL(config.get(mydiff::span<std::string_view>({"diff", "absent"}), 77), 77u);
    BOOST_CHECK(!config.enabled(mydiff::span<std::string_view>({"log", "absent"}), false));
}

BOOST_AUTO_TEST_CASE(malformed_numbers_fall_back)
{
    UserConfigHome home;
    TemporaryDirectory temp_dir;
    fs::current_path(temp_dir.path());
    Configuration::init();

    write_file(Configuration::path_local(mydiff::span<std::string_view>({"config"})),
        "[diff]\nchunk-size = lots\n[log]\nenabled = perhaps\n");

    Configuration config;
    BOOST_CHECK_EQUAL(config.get(mydiff::span<std::string_view>({"diff", "chunk-size"}), 1024), 1024u);
    BOOST_CHECK(config.enabled(mydiff::span<std::string_view>({"log", "enabled"}), true));
    BOOST_CHECK(!config.enabled(mydiff::span<std::string_view>({"log", "enabled"}), false));
}

BOOST_AUTO_TEST_CASE(write_changed_parameters)
{
    UserConfigHome home;
    TemporaryDirectory temp_dir;
    fs::current_path(temp_dir.path());
    Configuration::init();

    write_file(Configuration::path_user(mydiff::span<std::string_view>({"test.ini"})),
        "[section]\nkey = value_from_user\n");
    write_file(Configuration::path_local(mydiff::span<std::string_view>({"test.ini"})),
        "[section]\nother_key = value_from_local\n");

    // Modify a parameter from the user config
    {
        Configuration config(mydiff::span<std::string_view>({"test.ini"}));
        BOOST_CHECK_EQUAL(config[mydiff::span<std::string_view>({"section", "key"})], "value_from_user");
        config[mydiff::span<std::string_view>({"section", "key"})] = "new_value";
    }

    // The change lands in the project file and the user file is untouched
    std::string local = read_file(Configuration::path_local(mydiff::span<std::string_view>({"test.ini"})));
    BOOST_CHECK(local.find("key = new_value") != std::string::npos);
    BOOST_CHECK(local.find("other_key = value_from_local") != std::string::npos);

    std::string user = read_file(Configuration::path_user(mydiff::span<std::string_view>({"test.ini"})));
    BOOST_CHECK(user.find("value_from_user") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(do_not_write_unmodified_parameters)
{
    UserConfigHome home;
    TemporaryDirectory temp_dir;
    fs::current_path(temp_dir.path());
    Configuration::init();

    write_file(Configuration::path_user(mydiff::span<std::string_view>({"test.ini"})),
        "[section]\nkey = value_from_user\n");
    write_file(Configuration::path_local(mydiff::span<std::string_view>({"test.ini"})),
        "[section]\nother_key = value_from_local\n");

    // Read a parameter from the user config without modifying it
    {
        Configuration config(mydiff::span<std::string_view>({"test.ini"}));
        std::string value = config[mydiff::span<std::string_view>({"section", "key"})];
        BOOST_CHECK_EQUAL(value, "value_from_user");
    }

    std::string local = read_file(Configuration::path_local(mydiff::span<std::string_view>({"test.ini"})));
    BOOST_CHECK(local.find("value_from_user") == std::string::npos);
}

BOOST_AUTO_TEST_CASE(iterate_sections_and_values)
{
    UserConfigHome home;
    TemporaryDirectory temp_dir;
    fs::current_path(temp_dir.path());
    Configuration::init();

    write_file(Configuration::path_user(mydiff::span<std::string_view>({"config"})),
        "[diff]\nchunk-size = 4096\n[log]\nenabled = false\n");
    write_file(Configuration::path_local(mydiff::span<std::string_view>({"config"})),
        "[diff]\nchunk-size = 64\n");

    Configuration config;

    std::vector<std::string> sections;
    for (auto section : config.sections()) {
        sections.emplace_back(section);
    }
    BOOST_CHECK((sections == std::vector<std::string>{"diff", "log"}));

    std::vector<std::pair<std::string, std::string>> values;
    for (auto && [key, value] : config.values("diff")) {
        values.emplace_back(key, value);
    }
    BOOST_REQUIRE_EQUAL(values.size(), 1u);
    BOOST_CHECK_EQUAL(values[0].first, "chunk-size");
    BOOST_CHECK_EQUAL(values[0].second, "64");
}

BOOST_AUTO_TEST_CASE(zero_copy_block_means_default)
{
    UserConfigHome home;
    TemporaryDirectory temp_dir;
    fs::current_path(temp_dir.path());
    Configuration::init();

    write_file(Configuration::path_local(mydiff::span<std::string_view>({"config"})),
        "[patch]\ncopy-block = 0\n");

    Configuration config;
    size_t configured = config.get(mydiff::span<std::string_view>({"patch", "copy-block"}), mydiff::DEFAULT_COPY_BLOCK);
    BOOST_CHECK_EQUAL(configured, 0u);
    BOOST_CHECK_EQUAL(mydiff::copy_block_or_default(configured), mydiff::DEFAULT_COPY_BLOCK);
}

BOOST_AUTO_TEST_CASE(locators_from_dotted_names)
{
    auto locator = mydiff::split_locator("diff.chunk-size");
    BOOST_REQUIRE_EQUAL(locator.size(), 2u);
    BOOST_CHECK_EQUAL(locator[0], "diff");
    BOOST_CHECK_EQUAL(locator[1], "chunk-size");

    // the key keeps any further dots
    locator = mydiff::split_locator("log.file.name");
    BOOST_CHECK_EQUAL(locator[0], "log");
    BOOST_CHECK_EQUAL(locator[1], "file.name");

    BOOST_CHECK_THROW(mydiff::split_locator("nodot"), std::invalid_argument);
    BOOST_CHECK_THROW(mydiff::split_locator(".key"), std::invalid_argument);
    BOOST_CHECK_THROW(mydiff::split_locator("section."), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(set_through_dotted_locator)
{
    UserConfigHome home;
    TemporaryDirectory temp_dir;
    fs::current_path(temp_dir.path());
    Configuration::init();

    {
        Configuration config;
        config[mydiff::split_locator("diff.chunk-size")] = "2048";
    }

    Configuration config;
    BOOST_CHECK_EQUAL(config.get(mydiff::split_locator("diff.chunk-size"), 1), 2048u);
}

BOOST_AUTO_TEST_SUITE_END()
