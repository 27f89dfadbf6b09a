#include "config.hpp"
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <map>
#include <random>
#include <sstream>

namespace po = boost::program_options;

namespace life {

namespace {
    // LIFE_INTERVAL_MS -> interval-ms
    const std::map<std::string, std::string>& env_names() {
        static const std::map<std::string, std::string> names = {
            {"LIFE_WIDTH", "width"},
            {"LIFE_HEIGHT", "height"},
            {"LIFE_GENERATIONS", "generations"},
            {"LIFE_SEED", "seed"},
            {"LIFE_RENDER", "render"},
            {"LIFE_INTERVAL_MS", "interval-ms"},
            {"LIFE_FEED_PORT", "feed-port"},
        };
        return names;
    }

    // Numeric options are taken as text: lexical_cast to an unsigned type
    // accepts "-1" and wraps it, so digits are checked first
    void add_value_options(po::options_description& desc) {
        desc.add_options()
            ("width", po::value<std::string>(), "grid width in cells")
            ("height", po::value<std::string>(), "grid height in cells")
            ("generations", po::value<std::string>(), "number of generations to run")
            ("seed", po::value<std::string>(), "seed for the initial world (random if unset)")
            ("interval-ms", po::value<std::string>(), "delay between generations in milliseconds")
            ("feed-port", po::value<std::string>(), "TCP port for the JSON frame feed (0 = off)");
    }

    template <typename T>
    T parse_unsigned(const po::variables_map& vm, const std::string& name) {
        const auto& text = vm[name].as<std::string>();
        if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
            throw ConfigError("invalid value '" + text + "' for --" + name
                              + ": expected a non-negative integer");
        }
        try {
            return boost::lexical_cast<T>(text);
        } catch (const boost::bad_lexical_cast&) {
            throw ConfigError("value '" + text + "' for --" + name + " is out of range");
        }
    }

    void read_values(const po::variables_map& vm, Config& config) {
        if (vm.count("width")) config.width = parse_unsigned<std::size_t>(vm, "width");
        if (vm.count("height")) config.height = parse_unsigned<std::size_t>(vm, "height");
        if (vm.count("generations")) config.generations = parse_unsigned<std::uint64_t>(vm, "generations");
        if (vm.count("seed")) {
            config.seed = parse_unsigned<std::uint64_t>(vm, "seed");
            config.seed_given = true;
        }
        if (vm.count("render")) config.render = vm["render"].as<bool>();
        if (vm.count("interval-ms")) config.interval_ms = parse_unsigned<unsigned>(vm, "interval-ms");
        if (vm.count("feed-port")) config.feed_port = parse_unsigned<unsigned short>(vm, "feed-port");

        if (config.width == 0 || config.height == 0) {
            throw ConfigError("width and height must be greater than zero");
        }
        // Divide instead of multiplying so huge sides cannot wrap past the cap
        if (config.width > Config::MAX_CELLS / config.height) {
            throw ConfigError("grid of " + std::to_string(config.width) + "x"
                              + std::to_string(config.height) + " exceeds "
                              + std::to_string(Config::MAX_CELLS) + " cells");
        }
        if (config.generations == 0) {
            throw ConfigError("generations must be greater than zero");
        }
    }
}

Config Config::parse(int argc, const char* const argv[]) {
    Config config;

    po::options_description cli("Options");
    cli.add_options()
        ("help,h", "show this message");
    add_value_options(cli);
    cli.add_options()
        ("render", po::bool_switch(), "draw every generation to the console");

    // The environment carries render as an explicit value (LIFE_RENDER=1)
    po::options_description env("Environment");
    add_value_options(env);
    env.add_options()
        ("render", po::value<bool>(), "");

    std::ostringstream usage;
    usage << "Usage: life [options]\n\n" << cli
          << "\nEvery option except --help can also be set as LIFE_<NAME>,\n"
          << "for example LIFE_WIDTH=64 or LIFE_INTERVAL_MS=100.\n";
    config.usage = usage.str();

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, cli), vm);
        // store() keeps the first value it sees, so command line wins
        po::store(po::parse_environment(env, [](const std::string& name) -> std::string {
            auto it = env_names().find(name);
            return it == env_names().end() ? std::string() : it->second;
        }), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        throw ConfigError(e.what(), config.usage);
    }

    if (vm.count("help")) {
        config.show_help = true;
        return config;
    }

    try {
        read_values(vm, config);
    } catch (const ConfigError& e) {
        throw ConfigError(e.what(), config.usage);
    }

    return config;
}

std::uint64_t Config::resolve_seed() const {
    if (seed_given) {
        return seed;
    }
    std::random_device rd;
    return (static_cast<std::uint64_t>(rd()) << 32) | rd();
}

} // namespace life
