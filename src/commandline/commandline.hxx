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

#pragma once

#include <expected>
#include <filesystem>
#include <flat_map>
#include <string>

namespace commandline
{
enum class action
{
    none,
    version,
    move,
    copy,
    remove,
};

struct opts final
{
    commandline::action action{commandline::action::none};

    std::string source_path;
    std::string target_path;
    std::string remove_path;

    std::flat_map<std::string, std::string> log_levels;
    std::filesystem::path logfile;
};

std::expected<opts, std::string> run(int argc, char* argv[]) noexcept;
} // namespace commandline
