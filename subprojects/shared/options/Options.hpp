#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

namespace shared_opts {

/**
 * \brief Process-wide command line and JSON config loader.
 *
 * Each component registers a provider that adds its CLI options, taking
 * defaults from the JSON document named by `-c/--config`. Values given on
 * the command line win over the file.
 */
class Options {
public:
    using Provider = std::function<void(CLI::App&, const nlohmann::json&)>;

    enum class ParseResult { Ok, Help, Version, Error };

    static void add_provider(Provider provider);
    /// On Error, \p err holds a message suitable for the user.
    static ParseResult load_and_parse(int argc, char** argv, std::string& err);
    static std::optional<std::filesystem::path> get_config_file();
};

} // namespace shared_opts
