#include <iostream>

#include <boost/program_options.hpp>

#include <cppcoro/sync_wait.hpp>

#include <strata/blobs/blob_store.h>
#include <strata/fs/file_io.h>
#include <strata/service/core.h>

using namespace strata;

void static
show_version_info()
{
    std::cout << "strata " << STRATA_VERSION << "\n";
}

void static
show_usage(boost::program_options::options_description const& desc)
{
    std::cout << "usage: strata_tool [options] <command> [arguments]\n"
                 "\n"
                 "commands:\n"
                 "  put <name> <file>     store a file as a new blob version\n"
                 "  get <name> <file>     write a blob version to a file\n"
                 "  list <name>           list the versions of a blob\n"
                 "  remove <name>         remove a blob (or one version)\n"
                 "\n"
              << desc;
}

static int
put_blob(
    service_core& core,
    string const& name,
    file_path const& path,
    optional<integer> version,
    optional<integer> segment_length)
{
    auto contents = read_file_contents(path);
    auto& blobs = core.blobs();
    auto blob = cppcoro::sync_wait(
        [&]() -> cppcoro::task<blob_descriptor> {
            auto stream
                = co_await blobs.create_stream(name, version, segment_length);
            stream->metadata()["source"] = path.filename().string();
            co_await stream->write(contents);
            co_await stream->close();
            co_return stream->descriptor();
        }());
    std::cout << blob.name << " version " << blob.version << ": "
              << blob.length << " bytes in " << blob.segment_count
              << " segment(s)\n";
    return 0;
}

static int
get_blob(
    service_core& core,
    string const& name,
    file_path const& path,
    optional<integer> version)
{
    auto& blobs = core.blobs();
    return cppcoro::sync_wait([&]() -> cppcoro::task<int> {
        auto stream = co_await blobs.open_stream(name, version);
        if (!stream)
        {
            std::cerr << "blob not found: " << name << "\n";
            co_return 1;
        }
        std::ofstream output;
        open_file(
            output, path, std::ios::out | std::ios::trunc | std::ios::binary);
        co_await pipe(*stream, output);
        co_await stream->close();
        co_return 0;
    }());
}

static int
list_blob(service_core& core, string const& name)
{
    auto versions = cppcoro::sync_wait(core.blobs().get_blobs(name));
    if (versions.empty())
    {
        std::cerr << "blob not found: " << name << "\n";
        return 1;
    }
    for (auto const& blob : versions)
    {
        std::cout << blob.version << "\t" << blob.length << "\t"
                  << blob.segment_count << "\t" << blob.time_created << "\t"
                  << blob.blob_id << "\t" << write_json_document(blob.metadata)
                  << "\n";
    }
    return 0;
}

static int
remove_blob(service_core& core, string const& name, optional<integer> version)
{
    auto removed
        = cppcoro::sync_wait(core.blobs().remove_blob(name, version));
    std::cout << "removed " << removed.size() << " version(s)\n";
    return 0;
}

int
main(int argc, char const* const* argv)
{
    namespace po = boost::program_options;

    po::options_description desc("Supported options");
    desc.add_options()
        ("help", "show help message")
        ("version", "show version information")
        ("config-file", po::value<string>(), "specify the configuration file to use")
        ("database", po::value<string>(), "specify the database file (overrides the configuration)")
        ("blob-version", po::value<integer>(), "the blob version to get, put or remove")
        ("segment-length", po::value<integer>(), "the segment length for put")
    ;

    po::options_description hidden;
    hidden.add_options()
        ("command", po::value<string>())
        ("args", po::value<std::vector<string>>())
    ;

    po::options_description all;
    all.add(desc).add(hidden);

    po::positional_options_description positional;
    positional.add("command", 1).add("args", -1);

    po::variables_map vm;
    try
    {
        po::store(
            po::command_line_parser(argc, argv)
                .options(all)
                .positional(positional)
                .run(),
            vm);
        po::notify(vm);
    }
    catch (po::error& e)
    {
        std::cerr << e.what() << "\n";
        show_usage(desc);
        return 1;
    }

    if (vm.count("help"))
    {
        show_version_info();
        show_usage(desc);
        return 0;
    }

    if (vm.count("version"))
    {
        show_version_info();
        return 0;
    }

    if (!vm.count("command"))
    {
        show_usage(desc);
        return 1;
    }
    auto command = vm["command"].as<string>();
    auto args = vm.count("args") ? vm["args"].as<std::vector<string>>()
                                 : std::vector<string>();

    optional<integer> version;
    if (vm.count("blob-version"))
        version = vm["blob-version"].as<integer>();
    optional<integer> segment_length;
    if (vm.count("segment-length"))
        segment_length = vm["segment-length"].as<integer>();

    try
    {
        service_config defaults;
        defaults.sqlite.path = "strata.db";
        service_config config
            = vm.count("config-file")
                  ? read_service_config(
                      vm["config-file"].as<string>(), defaults)
                  : defaults;
        if (vm.count("database"))
            config.sqlite.path = vm["database"].as<string>();

        service_core core(config);
        core.start();

        int result;
        if (command == "put" && args.size() == 2)
            result = put_blob(core, args[0], args[1], version, segment_length);
        else if (command == "get" && args.size() == 2)
            result = get_blob(core, args[0], args[1], version);
        else if (command == "list" && args.size() == 1)
            result = list_blob(core, args[0]);
        else if (command == "remove" && args.size() == 1)
            result = remove_blob(core, args[0], version);
        else
        {
            show_usage(desc);
            result = 1;
        }

        // Flush everything before exiting.
        core.stop();
        return result;
    }
    catch (std::exception& e)
    {
        std::cerr << boost::diagnostic_information(e) << "\n";
        return 1;
    }
}
