#include <mydiff/configuration.hpp>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

#include <boost/interprocess/sync/file_lock.hpp>
#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/ptree.hpp>

namespace fs = std::filesystem;
namespace pt = boost::property_tree;

// write keys git-style, as "\tkey = value" inside sections
namespace boost { namespace property_tree { namespace ini_parser {
namespace detail {
template <>
void write_keys<ptree>(std::basic_ostream<ptree::key_type::value_type> & stream, const ptree& pt, bool throw_on_children)
{
    for (auto const& [key, child] : pt) {
        if (!child.empty()) {
            if (throw_on_children) {
                BOOST_PROPERTY_TREE_THROW(ini_parser_error("ptree is too deep", "", 0));
            }
            continue;
        }
        if (throw_on_children) {
            stream << '\t';
        }
        stream << key << " = " << child.data() << '\n';
    }
}
}
} } }

namespace mydiff {

namespace {

constexpr std::string_view PROJECT_DIR = ".mydiff";

fs::path config_dir_user()
{
    fs::path path;
    char const* xdg_config_home = getenv("XDG_CONFIG_HOME");
    if (xdg_config_home != nullptr && *xdg_config_home) {
        path = fs::path(xdg_config_home);
    } else {
        char const* home = getenv("HOME");
        if (home == nullptr || !*home) {
            throw std::runtime_error("Neither XDG_CONFIG_HOME nor HOME is set.");
        }
        path = fs::path(home) / ".config";
    }
    return path / "mydiff";
}

std::string path_helper(fs::path path, std::span<std::string_view const> subpaths, bool is_dir)
{
    for (auto const& subpath : subpaths) {
        path /= subpath;
    }
    if (is_dir) {
        fs::create_directories(path);
        path /= "";
    } else if (path.has_parent_path()) {
        fs::create_directories(path.parent_path());
    }
    return path.native();
}

pt::ptree const* find_node(pt::ptree const& root, std::span<std::string_view const> locator)
{
    auto const* node = &root;
    for (auto const& part : locator) {
        auto it = node->find(std::string(part));
        if (it == node->not_found()) {
            return nullptr;
        }
        node = &it->second;
    }
    return node;
}

pt::ptree & find_or_create(pt::ptree & root, std::span<std::string_view const> locator)
{
    auto * node = &root;
    for (auto const& part : locator) {
        std::string key(part);
        auto it = node->find(key);
        if (it == node->not_found()) {
            node = &node->push_back(std::make_pair(key, pt::ptree()))->second;
        } else {
            node = &it->second;
        }
    }
    return *node;
}

void lock_or_wait(boost::interprocess::file_lock & lock, std::string const& path, bool shared)
{
    if (shared ? lock.try_lock_sharable() : lock.try_lock()) {
        return;
    }
    std::cerr << "Waiting for another process to finish with " << path << " ..." << std::endl;
    if (shared) {
        lock.lock_sharable();
    } else {
        lock.lock();
    }
}

class ConfigurationImpl {
public:
    ConfigurationImpl(std::span<std::string_view const> subpath, bool user_wide)
    : path_(user_wide ? Configuration::path_user(subpath) : Configuration::path_local(subpath))
    {
        if (!user_wide) {
            std::string path_user = Configuration::path_user(subpath);
            if (fs::exists(path_user)) {
                dflt_lock_ = boost::interprocess::file_lock(path_user.c_str());
                lock_or_wait(dflt_lock_, path_user, true);
                pt::ini_parser::read_ini(path_user, dflt_);
            }
        }
        if (fs::exists(path_)) {
            lock_ = boost::interprocess::file_lock(path_.c_str());
            lock_or_wait(lock_, path_, false);
            pt::ini_parser::read_ini(path_, tree_);
        }
    }

    ~ConfigurationImpl()
    {
        bool changed = false;
        for (auto & [locator, edit] : edits_) {
            auto & [original, value] = edit;
            if (value != original) {
                std::vector<std::string_view> parts(locator.begin(), locator.end());
                find_or_create(tree_, parts).put_value(value);
                changed = true;
            }
        }
        if (changed) {
            try {
                pt::ini_parser::write_ini(path_, tree_);
            } catch (pt::ini_parser_error const& e) {
                std::cerr << "Could not save " << path_ << ": " << e.what() << std::endl;
            }
        }
    }

    std::string & operator[](std::span<std::string_view const> locator)
    {
        std::vector<std::string> key(locator.begin(), locator.end());
        auto it = edits_.find(key);
        if (it == edits_.end()) {
            std::string current = lookup(locator).value_or("");
            it = edits_.emplace(std::move(key), std::make_pair(current, current)).first;
        }
        return it->second.second;
    }

    std::optional<std::string> lookup(std::span<std::string_view const> locator) const
    {
        std::vector<std::string> key(locator.begin(), locator.end());
        auto it = edits_.find(key);
        if (it != edits_.end()) {
            return it->second.second;
        }
        for (auto const* tree : {&tree_, &dflt_}) {
            auto const* node = find_node(*tree, locator);
            if (node != nullptr && node->empty()) {
                return node->data();
            }
        }
        return std::nullopt;
    }

    std::generator<std::string_view> sections()
    {
        std::unordered_set<std::string> seen;
        for (auto const* tree : {&tree_, &dflt_}) {
            for (auto const& [name, section] : *tree) {
                if (!section.empty() && seen.insert(name).second) {
                    co_yield name;
                }
            }
        }
    }

    std::generator<StringViewPair> values(std::string_view section)
    {
        std::unordered_set<std::string> seen;
        std::string_view locator[] = {section};
        for (auto const* tree : {&tree_, &dflt_}) {
            auto const* node = find_node(*tree, locator);
            if (node == nullptr) {
                continue;
            }
            for (auto const& [key, value] : *node) {
                if (value.empty() && seen.insert(key).second) {
                    co_yield StringViewPair(key, value.data());
                }
            }
        }
    }

private:
    std::string path_;
    pt::ptree tree_;
    pt::ptree dflt_;
    boost::interprocess::file_lock lock_;
    boost::interprocess::file_lock dflt_lock_;
    // locator -> (value when first accessed, current value)
    std::map<std::vector<std::string>, std::pair<std::string, std::string>> edits_;
};

} // namespace

bool Configuration::init()
{
    try {
        path_local();
    } catch (std::invalid_argument const&) {
        fs::create_directory(PROJECT_DIR);
        return true;
    }
    return false;
}

Configuration::Configuration(std::span<std::string_view const> subpath, bool user_wide)
: impl_(reinterpret_cast<void*>(new ConfigurationImpl(subpath, user_wide)))
{ }

Configuration::~Configuration()
{
    delete reinterpret_cast<ConfigurationImpl*>(impl_);
}

std::string & Configuration::operator[](std::span<std::string_view const> locator)
{
    return (*reinterpret_cast<ConfigurationImpl*>(impl_))[locator];
}

size_t Configuration::get(std::span<std::string_view const> locator, size_t dflt)
{
    auto value = reinterpret_cast<ConfigurationImpl*>(impl_)->lookup(locator);
    if (!value) {
        return dflt;
    }
    auto text = trim(*value);
    if (text.empty() || text.find_first_not_of("0123456789") != std::string_view::npos) {
        return dflt;
    }
    try {
        return (size_t)std::stoull(std::string(text));
    } catch (std::out_of_range const&) {
        return dflt;
    }
}

bool Configuration::enabled(std::span<std::string_view const> locator, bool dflt)
{
    auto value = reinterpret_cast<ConfigurationImpl*>(impl_)->lookup(locator);
    if (!value) {
        return dflt;
    }
    auto text = trim(*value);
    if (text == "false" || text == "no" || text == "off" || text == "0") {
        return false;
    }
    if (text == "true" || text == "yes" || text == "on" || text == "1") {
        return true;
    }
    return dflt;
}

std::generator<std::string_view> Configuration::sections()
{
    return reinterpret_cast<ConfigurationImpl*>(impl_)->sections();
}

std::generator<StringViewPair> Configuration::values(std::string_view section)
{
    return reinterpret_cast<ConfigurationImpl*>(impl_)->values(section);
}

std::string Configuration::path_local(std::span<std::string_view const> subpaths, bool is_dir)
{
    fs::path project_dir;
    fs::path user_dir = config_dir_user();
    for (
        fs::path path = fs::current_path(), parent_path = path.parent_path();
        !path.empty();
        path = parent_path, parent_path = path.parent_path()
    ) {
        fs::path candidate = path / PROJECT_DIR;
        if (candidate == user_dir) {
            break;
        }
        if (fs::is_directory(candidate)) {
            project_dir = candidate;
            break;
        }
        if (path == parent_path) {
            break;
        }
    }
    if (project_dir.empty()) {
        throw std::invalid_argument("Could not find .mydiff directory for project. Create one.");
    }
    return path_helper(project_dir, subpaths, is_dir);
}

std::string Configuration::path_user(std::span<std::string_view const> subpaths, bool is_dir)
{
    return path_helper(config_dir_user(), subpaths, is_dir);
}

std::vector<std::string_view> split_locator(std::string_view dotted)
{
    auto dot = dotted.find('.');
    if (dot == std::string_view::npos || dot == 0 || dot + 1 == dotted.size()) {
        throw std::invalid_argument("expected section.key, got \"" + std::string(dotted) + "\"");
    }
    return {dotted.substr(0, dot), dotted.substr(dot + 1)};
}

} // namespace mydiff
