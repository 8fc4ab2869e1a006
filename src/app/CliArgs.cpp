//------------------------------------------------------------------------------
/*
    This file is part of marketsync
    Copyright (c) 2025, the marketsync developers.

    Permission to use, copy, modify, and distribute this software for any
    purpose with or without fee is hereby granted, provided that the above
    copyright notice and this permission notice appear in all copies.

    THE  SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL WARRANTIES
    WITH  REGARD  TO  THIS  SOFTWARE  INCLUDING  ALL  IMPLIED  WARRANTIES  OF
    MERCHANTABILITY  AND  FITNESS. IN NO EVENT SHALL THE AUTHOR BE LIABLE FOR
    ANY  SPECIAL,  DIRECT,  INDIRECT, OR CONSEQUENTIAL DAMAGES OR ANY DAMAGES
    WHATSOEVER  RESULTING  FROM  LOSS  OF USE, DATA OR PROFITS, WHETHER IN AN
    ACTION  OF  CONTRACT, NEGLIGENCE OR OTHER TORTIOUS ACTION, ARISING OUT OF
    OR IN CONNECTION WITH THE USE OR PERFORMANCE OF THIS SOFTWARE.
*/
//==============================================================================

#include "app/CliArgs.hpp"

#include "util/config/ConfigDescription.hpp"

#include <boost/program_options/options_description.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/positional_options.hpp>
#include <boost/program_options/value_semantic.hpp>
#include <boost/program_options/variables_map.hpp>

#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <utility>

namespace app {

CliArgs::Action
CliArgs::parse(int argc, char const* argv[])
{
    namespace po = boost::program_options;

    // clang-format off
    po::options_description description("Options");
    description.add_options()
        ("help,h", "print help message and exit")
        ("conf,c", po::value<std::string>()->default_value(kDEFAULT_CONFIG_PATH), "configuration file")
        ("events,e", po::value<std::string>(), "JSON file with an array of raw events to normalize")
        ("verify", "checks whether the config file is valid and exits")
        ("config-description", "prints every supported configuration key and exits")
    ;
    // clang-format on
    po::positional_options_description positional;
    positional.add("conf", 1);

    po::variables_map parsed;
    try {
        po::store(
            po::command_line_parser(argc, argv).options(description).positional(positional).run(), parsed
        );
        po::notify(parsed);
    } catch (po::error const& e) {
        std::cerr << e.what() << std::endl << description << std::endl;
        return Action{Action::Exit{EXIT_FAILURE}};
    }

    if (parsed.contains("help")) {
        std::cout << "marketsync\n\n" << description;
        return Action{Action::Exit{EXIT_SUCCESS}};
    }

    if (parsed.contains("config-description")) {
        util::config::ConfigDescription::write(std::cout);
        return Action{Action::Exit{EXIT_SUCCESS}};
    }

    auto configPath = parsed["conf"].as<std::string>();

    if (parsed.contains("verify"))
        return Action{Action::VerifyConfig{.configPath = std::move(configPath)}};

    if (not parsed.contains("events")) {
        std::cerr << "Missing --events" << std::endl << description << std::endl;
        return Action{Action::Exit{EXIT_FAILURE}};
    }

    return Action{Action::Run{.configPath = std::move(configPath), .eventsPath = parsed["events"].as<std::string>()}};
}

}  // namespace app
