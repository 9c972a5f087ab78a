#pragma once

#include <mydiff/common.hpp>

#include <generator>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace mydiff {

// Settings live in INI files. A locator is {section, key}.
//   [diff]  chunk-size   bytes per chunk when generating
//   [patch] copy-block   bytes per copy when applying
//   [log]   enabled      "false" to stop writing logs
// Values in the project's .mydiff directory override the per-user ones.

class Configuration {
public:
    /*
     * Create the project configuration directory if none is found.
     *
     * Returns true if a new directory was created.
     */
    static bool init();

    /*
     * Open the configuration file at subpath.
     *
     * Unless user_wide is set this is the project file, and the per-user
     * file of the same name supplies defaults. Throws std::invalid_argument
     * when there is no project directory.
     */
    Configuration(std::span<std::string_view const> subpath = span<std::string_view>({"config"}), bool user_wide = false);

    /*
     * Accessor for configuration values. Modified values are written back
     * when the Configuration is destroyed.
     */
    std::string & operator[](std::span<std::string_view const> locator);

    /*
     * Numeric value, or dflt when unset or not a number.
     */
    size_t get(std::span<std::string_view const> locator, size_t dflt);

    bool enabled(std::span<std::string_view const> locator, bool dflt = true);

    /*
     * Generator to iterate over sections.
     */
    std::generator<std::string_view> sections();

    /*
     * Generator to iterate over key-value pairs of a section.
     */
    std::generator<StringViewPair> values(std::string_view section);

    ~Configuration();

    Configuration(Configuration const&) = delete;
    Configuration& operator=(Configuration const&) = delete;

    /*
     * Get a per-project configuration path.
     */
    static std::string path_local(std::span<std::string_view const> subpath = {}, bool is_dir = false);

    /*
     * Get a per-user configuration path.
     */
    static std::string path_user(std::span<std::string_view const> subpath = {}, bool is_dir = false);

private:
    void* impl_;
};

/*
 * Split "section.key" into a locator. The key is everything after the
 * first dot. Throws std::invalid_argument if either part is empty.
 */
std::vector<std::string_view> split_locator(std::string_view dotted);

} // namespace mydiff
