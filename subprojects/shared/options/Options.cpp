#include "Options.hpp"

#include <fstream>
#include <iostream>
#include <mutex>
#include <utility>
#include <vector>

namespace shared_opts {

namespace {

struct Registry {
    std::mutex mutex;
    std::vector<Options::Provider> providers;
    std::optional<std::filesystem::path> config_file;
};

Registry& registry() {
    static Registry r;
    return r;
}

// Looks for -c/--config ahead of the real parse; everything else is ignored.
std::string find_config_argument(int argc, char** argv) {
    std::string path;
    CLI::App probe{"probe"};
    probe.set_help_flag();
    probe.allow_extras(true);
    probe.add_option("-c,--config", path);
    try {
        probe.parse(argc, argv);
    } catch (const CLI::ParseError&) {
        // Reported by the strict parse
    }
    return path;
}

bool read_config(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream in(path);
    if (!in) {
        err = "cannot open config file '" + path + "'";
        return false;
    }
    try {
        in >> out;
    } catch (const nlohmann::json::parse_error& e) {
        err = "malformed config file '" + path + "': " + e.what();
        return false;
    }
    if (!out.is_object()) {
        err = "config file '" + path + "' must contain a JSON object";
        return false;
    }
    return true;
}

} // namespace

void Options::add_provider(Provider provider) {
    auto& r = registry();
    std::lock_guard<std::mutex> lock(r.mutex);
    r.providers.push_back(std::move(provider));
}

Options::ParseResult Options::load_and_parse(int argc, char** argv, std::string& err) {
    auto& r = registry();
    std::lock_guard<std::mutex> lock(r.mutex);
    r.config_file.reset();

    nlohmann::json config = nlohmann::json::object();
    const std::string config_path = find_config_argument(argc, argv);
    if (!config_path.empty()) {
        if (!read_config(config_path, config, err)) return ParseResult::Error;
        std::error_code ec;
        auto absolute = std::filesystem::absolute(config_path, ec);
        r.config_file = ec ? std::filesystem::path(config_path) : absolute;
    }

    CLI::App app{"task-relay: agent coordination and handoff engine"};
    app.set_version_flag("-V,--version", std::string{"task-relay 0.1"});
    std::string unused_config;
    app.add_option("-c,--config", unused_config, "JSON config file to load")->group("General");

    try {
        for (const auto& provider : r.providers) {
            if (provider) provider(app, config);
        }
    } catch (const std::exception& e) {
        // Providers throw when their JSON section has the wrong shape
        err = std::string("invalid configuration: ") + e.what();
        return ParseResult::Error;
    }

    try {
        app.parse(argc, argv);
    } catch (const CLI::CallForHelp&) {
        std::cout << app.help() << std::endl;
        return ParseResult::Help;
    } catch (const CLI::CallForAllHelp&) {
        std::cout << app.help("", CLI::AppFormatMode::All) << std::endl;
        return ParseResult::Help;
    } catch (const CLI::CallForVersion& v) {
        std::cout << v.what() << std::endl;
        return ParseResult::Version;
    } catch (const CLI::ParseError& e) {
        err = e.what();
        return ParseResult::Error;
    }
    return ParseResult::Ok;
}

std::optional<std::filesystem::path> Options::get_config_file() {
    auto& r = registry();
    std::lock_guard<std::mutex> lock(r.mutex);
    return r.config_file;
}

} // namespace shared_opts
