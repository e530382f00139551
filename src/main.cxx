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

#include <print>

#include <system_error>

#include <cstdio>
#include <cstdlib>

#include "commandline/commandline.hxx"

#include "fsflow/task/task.hxx"

#include "logger.hxx"
#include "package.hxx"

static int
report_failure(const fsflow::task& task, const std::error_code& ec) noexcept
{
    std::println(stderr, "{}: {}", task.name(), ec.message());
    return EXIT_FAILURE;
}

int
main(int argc, char* argv[]) noexcept
{
    const auto opts = commandline::run(argc, argv);
    if (!opts)
    {
        std::println(stderr, "{}", opts.error());
        return EXIT_FAILURE;
    }

    switch (opts->action)
    {
        case commandline::action::version:
        {
            std::println("{} {}", fsflow::package.name_fancy, fsflow::package.version);
            return EXIT_SUCCESS;
        }
        case commandline::action::move:
        {
            fsflow::move task(opts->source_path, opts->target_path);
            const auto result = task.run();
            if (!result)
            {
                return report_failure(task, result.error());
            }
            std::println("{}", result->string());
            return EXIT_SUCCESS;
        }
        case commandline::action::copy:
        {
            fsflow::copy task(opts->source_path, opts->target_path);
            const auto result = task.run();
            if (!result)
            {
                return report_failure(task, result.error());
            }
            std::println("{}", result->string());
            return EXIT_SUCCESS;
        }
        case commandline::action::remove:
        {
            fsflow::remove task(opts->remove_path);
            const auto result = task.run();
            if (!result)
            {
                return report_failure(task, result.error());
            }
            return EXIT_SUCCESS;
        }
        case commandline::action::none:
            break;
    }

    logger::critical("no action selected");
    return EXIT_FAILURE;
}
