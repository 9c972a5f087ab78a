#include <mydiff/configuration.hpp>
#include <mydiff/error.hpp>
#include <mydiff/integrity.hpp>
#include <mydiff/log.hpp>
#include <mydiff/stream.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <span>
#include <string>
#include <vector>

using namespace std;
using namespace mydiff;

namespace fs = std::filesystem;

static void print_error(string_view msg)
{
    cerr << "ERROR: " << msg << endl;
}

static void print_table(vector<StringPair> const& table)
{
    size_t width = 0;
    for (auto && [name, value] : table) {
        width = max(width, name.size());
    }
    for (auto && [name, value] : table) {
        cout << left << setw((int)width) << name << ": " << value << endl;
    }
}

static void usage()
{
    cerr << "usage: mydiff create [--chunk-size N] [--name NAME]... OLD... LATEST" << endl;
    cerr << "       mydiff update FILE DIFF" << endl;
    cerr << "       mydiff check DIFF [FILE]" << endl;
    cerr << "       mydiff init" << endl;
    cerr << "       mydiff config [SECTION.KEY [VALUE]]" << endl;
    cerr << endl;
    cerr << "Generate the difference between two files." << endl;
    cerr << "Update the first file with the difference in order to produce the second file." << endl;
}

// Checks whether a file exists, is a regular file and can be opened.
static bool validate_file(fs::path const& path, bool writable = false)
{
    if (!fs::exists(path)) {
        print_error(path.string() + " does not exist.");
        return false;
    }
    if (!fs::is_regular_file(path)) {
        print_error(path.string() + " is not a file.");
        return false;
    }
    fstream f(path, writable ? (ios::in | ios::out | ios::binary) : (ios::in | ios::binary));
    if (!f) {
        print_error("cannot open " + path.string() + (writable ? " for writing." : "."));
        return false;
    }
    return true;
}

// The work is done by the time a command logs, so a log failure only warns.
static void log_command(std::span<StringViewPair const> fields, bool logging)
{
    if (!logging) {
        return;
    }
    try {
        Log::log(fields);
    } catch (exception const& e) {
        cerr << "WARNING: could not write log: " << e.what() << endl;
    }
}

static unique_ptr<Configuration> open_configuration()
{
    try {
        return make_unique<Configuration>();
    } catch (invalid_argument const&) {
        // not inside a project
        return make_unique<Configuration>(mydiff::span<string_view>({"config"}), true);
    }
}

static int create(vector<string_view> args, Configuration & config, bool logging)
{
    size_t chunk_size = config.get(mydiff::span<string_view>({"diff", "chunk-size"}), DEFAULT_CHUNK_SIZE);
    vector<string> names;
    vector<fs::path> files;

    for (size_t i = 0; i < args.size(); ++ i) {
        if (args[i] == "--chunk-size" || args[i] == "--name") {
            if (i + 1 == args.size()) {
                print_error(string(args[i]) + " needs a value.");
                return 1;
            }
            string_view value = args[++ i];
            if (args[i - 1] == "--name") {
                names.emplace_back(value);
                continue;
            }
            if (value.empty() || value.find_first_not_of("0123456789") != string_view::npos) {
                print_error("chunk size must be a positive number of bytes.");
                return 1;
            }
            chunk_size = stoull(string(value));
            if (chunk_size == 0) {
                print_error("chunk size must be a positive number of bytes.");
                return 1;
            }
        } else {
            files.emplace_back(args[i]);
        }
    }

    if (files.size() < 2) {
        usage();
        return 1;
    }

    fs::path latest = files.back();
    files.pop_back();

    for (auto & old : files) {
        if (!validate_file(old)) {
            return 1;
        }
    }
    if (!validate_file(latest)) {
        return 1;
    }

    for (size_t idx = 0; idx < files.size(); ++ idx) {
        fs::path const& old = files[idx];
        fs::path out = diff_output_path(old, latest, names, idx);

        print_table({
            {"Old file", old.string()},
            {"New file", latest.string()},
            {"Diff", out.string()},
        });

        auto stats = StreamingDiffer::generate(old, latest, out, chunk_size);

        print_table({
            {"Chunks", to_string(stats.chunks)},
            {"Operations", to_string(stats.ops)},
            {"Diff size", to_string(stats.diff_bytes)},
        });

        string chunks = to_string(stats.chunks), ops = to_string(stats.ops), size = to_string(stats.diff_bytes);
        string old_str = old.string(), new_str = latest.string(), out_str = out.string();
        log_command(mydiff::span<StringViewPair>({
            {"command", "create"},
            {"old", old_str},
            {"new", new_str},
            {"diff", out_str},
            {"chunks", chunks},
            {"ops", ops},
            {"bytes", size},
        }), logging);
    }
    return 0;
}

static int update(vector<string_view> args, Configuration & config, bool logging)
{
    if (args.size() != 2) {
        usage();
        return 1;
    }
    fs::path file(args[0]), diff(args[1]);

    if (!validate_file(file, true) || !validate_file(diff)) {
        return 1;
    }
    if (!has_diff_extension(diff)) {
        print_error(diff.string() + " is not a .diff file.");
        return 1;
    }

    print_table({
        {"File", file.string()},
        {"Diff", diff.string()},
    });

    auto report = IntegrityGuard::verify(file, diff);

    size_t copy_block = copy_block_or_default(
        config.get(mydiff::span<string_view>({"patch", "copy-block"}), DEFAULT_COPY_BLOCK));
    auto stats = StreamingPatcher::apply(file, diff, file, copy_block);

    print_table({
        {"Operations", to_string(stats.ops)},
        {"Copied", to_string(stats.copied)},
        {"Inserted", to_string(stats.inserted)},
        {"Skipped", to_string(stats.skipped)},
    });

    string file_str = file.string(), diff_str = diff.string();
    string digest = to_hex(report.digest), ops = to_string(stats.ops);
    log_command(mydiff::span<StringViewPair>({
        {"command", "update"},
        {"file", file_str},
        {"diff", diff_str},
        {"source_sha256", digest},
        {"ops", ops},
    }), logging);
    return 0;
}

static int check(vector<string_view> args, bool logging)
{
    if (args.empty() || args.size() > 2) {
        usage();
        return 1;
    }
    fs::path diff(args[0]);
    if (!validate_file(diff)) {
        return 1;
    }

    auto report = IntegrityGuard::validate_structure(diff);
    vector<StringPair> table = {
        {"Diff", diff.string()},
        {"Size", to_string(report.size)},
        {"Operations", to_string(report.op_count)},
        {"Source SHA-256", to_hex(report.digest)},
    };

    if (args.size() == 2) {
        fs::path file(args[1]);
        if (!validate_file(file)) {
            return 1;
        }
        IntegrityGuard::verify_provenance(file, report.digest);
        table.emplace_back("Source", file.string() + " (matches)");
    }
    print_table(table);

    string diff_str = diff.string(), ops = to_string(report.op_count);
    log_command(mydiff::span<StringViewPair>({
        {"command", "check"},
        {"diff", diff_str},
        {"ops", ops},
    }), logging);
    return 0;
}

static int init()
{
    if (Configuration::init()) {
        cout << "Created " << Configuration::path_local() << endl;
    } else {
        cout << "Already inside a project at " << Configuration::path_local() << endl;
    }
    return 0;
}

// List all settings, show one, or set one.
static int configure(vector<string_view> args, Configuration & config)
{
    if (args.empty()) {
        vector<StringPair> table;
        for (auto section : config.sections()) {
            for (auto && [key, value] : config.values(section)) {
                table.emplace_back(string(section) + "." + string(key), value);
            }
        }
        print_table(table);
        return 0;
    }
    if (args.size() > 2) {
        usage();
        return 1;
    }

    auto locator = split_locator(args[0]);
    string & value = config[locator];
    if (args.size() == 2) {
        value = args[1];
        return 0;
    }
    if (value.empty()) {
        print_error(string(args[0]) + " is not set.");
        return 1;
    }
    cout << value << endl;
    return 0;
}

int main(int argc, char **argv)
{
    if (argc < 2) {
        usage();
        return 1;
    }

    string_view command = argv[1];
    vector<string_view> args(argv + 2, argv + argc);

    try {
        auto config = open_configuration();
        bool logging = config->enabled(mydiff::span<string_view>({"log", "enabled"}));

        if (command == "create") {
            return create(args, *config, logging);
        } else if (command == "update") {
            return update(args, *config, logging);
        } else if (command == "check") {
            return check(args, logging);
        } else if (command == "init") {
            return init();
        } else if (command == "config") {
            return configure(args, *config);
        } else if (command == "-h" || command == "--help" || command == "help") {
            usage();
            return 0;
        }
        print_error("unknown command " + string(command));
        usage();
        return 1;
    } catch (FormatError const& e) {
        print_error(string("malformed diff: ") + e.what());
    } catch (ProvenanceError const& e) {
        print_error(string(e.what()) + "; the diff was generated against a different version of the file.");
    } catch (fs::filesystem_error const& e) {
        print_error(e.what());
    } catch (exception const& e) {
        print_error(e.what());
    }
    return 1;
}
