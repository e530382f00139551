/**
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation; either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */

#include <algorithm>
#include <expected>
#include <filesystem>
#include <flat_map>
#include <format>
#include <memory>
#include <string>
#include <vector>

#include <magic_enum/magic_enum.hpp>

#include <spdlog/spdlog.h>

#include <CLI/CLI.hpp>

#include "commandline/commandline.hxx"

#include "logger.hxx"

struct opts_data final
{
    commandline::action action{commandline::action::none};

    std::string source_path;
    std::string target_path;
    std::string remove_path;

    std::vector<std::string> raw_log_levels;
    std::flat_map<std::string, std::string> log_levels;
    std::filesystem::path logfile;

    bool version{false};
};

static void
setup_subcommand_move(CLI::App& app, const std::shared_ptr<opts_data>& opt) noexcept
{
    auto* sub = app.add_subcommand("move", "Move a file or directory");

    sub->add_option("source", opt->source_path, "File or directory to move")->expected(1);
    sub->add_option("target", opt->target_path, "Destination path or directory")->expected(1);

    sub->callback([opt]() { opt->action = commandline::action::move; });
}

static void
setup_subcommand_copy(CLI::App& app, const std::shared_ptr<opts_data>& opt) noexcept
{
    auto* sub = app.add_subcommand("copy", "Copy a file or directory recursively");

    sub->add_option("source", opt->source_path, "File or directory to copy")->expected(1);
    sub->add_option("target", opt->target_path, "Destination path or directory")->expected(1);

    sub->callback([opt]() { opt->action = commandline::action::copy; });
}

static void
setup_subcommand_remove(CLI::App& app, const std::shared_ptr<opts_data>& opt) noexcept
{
    auto* sub = app.add_subcommand("remove", "Remove a file or directory recursively");

    sub->add_option("path", opt->remove_path, "File or directory to remove")->expected(1);

    sub->callback([opt]() { opt->action = commandline::action::remove; });
}

static void
setup_commandline(CLI::App& app, const std::shared_ptr<opts_data>& opt) noexcept
{
    app.add_option("--loglevel", opt->raw_log_levels, "Set the loglevel. Format: domain=level")
        ->check(
            [opt](const std::string& value)
            {
                constexpr auto log_levels = magic_enum::enum_names<spdlog::level::level_enum>();
                constexpr auto valid_domains = magic_enum::enum_names<logger::domain>();

                const auto pos = value.find('=');
                if (pos == std::string::npos)
                {
                    return std::string("Must be in format domain=level");
                }

                const auto domain = value.substr(0, pos);
                if (!std::ranges::contains(valid_domains, domain))
                {
                    return std::format("Invalid domain: {}", domain);
                }

                const auto level = value.substr(pos + 1);
                if (!std::ranges::contains(log_levels, level) ||
                    level == magic_enum::enum_name(spdlog::level::n_levels))
                {
                    return std::format("Invalid log level: {}", level);
                }

                opt->log_levels.insert_or_assign(domain, level);

                return std::string();
            });

    app.add_option("--logfile", opt->logfile, "absolute path to the logfile")
        ->expected(1)
        ->check(
            [](const std::filesystem::path& input)
            {
                if (input.is_absolute())
                {
                    return std::string();
                }
                return std::format("Logfile path must be absolute: {}", input.string());
            });

    app.add_flag("-v,--version", opt->version, "Show version information");

    setup_subcommand_move(app, opt);
    setup_subcommand_copy(app, opt);
    setup_subcommand_remove(app, opt);
    app.require_subcommand(0, 1);

    app.callback([opt]() { logger::initialize(opt->log_levels, opt->logfile); });
}

std::expected<commandline::opts, std::string>
commandline::run(int argc, char* argv[]) noexcept
{
    CLI::App app{PACKAGE_NAME_FANCY, "Move, copy and remove files as workflow tasks"};

    auto opt = std::make_shared<opts_data>();
    setup_commandline(app, opt);

    try
    {
        app.parse(argc, argv);
    }
    catch (const CLI::CallForHelp&)
    {
        return std::unexpected{app.help()};
    }
    catch (const CLI::ParseError& e)
    {
        return std::unexpected{std::string(e.what())};
    }

    if (opt->version)
    {
        opt->action = commandline::action::version;
    }
    else if (opt->action == commandline::action::none)
    {
        return std::unexpected{std::string("A subcommand is required: move, copy or remove")};
    }

    return commandline::opts{.action = opt->action,
                             .source_path = opt->source_path,
                             .target_path = opt->target_path,
                             .remove_path = opt->remove_path,
                             .log_levels = opt->log_levels,
                             .logfile = opt->logfile};
}
