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

#include <string>

#include <system_error>

#include "fsflow/error.hxx"

const std::error_category&
fsflow::error_category() noexcept
{
    struct category final : std::error_category
    {
        const char*
        name() const noexcept override final
        {
            return "fsflow::error_category()";
        }

        std::string
        message(int c) const override final
        {
            switch (static_cast<fsflow::error_code>(c))
            {
                case fsflow::error_code::none:
                    return "none";
                case fsflow::error_code::missing_source_path:
                    return "No `source_path` provided";
                case fsflow::error_code::missing_target_path:
                    return "No `target_path` provided";
                case fsflow::error_code::missing_remove_path:
                    return "No `remove_path` provided";
                case fsflow::error_code::root_preserve_source:
                    return "Refusing to use `/` as `source_path`";
                case fsflow::error_code::root_preserve:
                    return "Refusing to remove `/`";
                default:
                    return "unknown error";
            }
        }

        std::error_condition
        default_error_condition(int c) const noexcept override final
        {
            if (c == 0)
            {
                return {};
            }
            return fsflow::errc::invalid_input;
        }
    };
    static const category instance{};
    return instance;
}

const std::error_category&
fsflow::error_condition_category() noexcept
{
    struct category final : std::error_category
    {
        const char*
        name() const noexcept override final
        {
            return "fsflow::error_condition_category()";
        }

        std::string
        message(int c) const override final
        {
            switch (static_cast<fsflow::errc>(c))
            {
                case fsflow::errc::invalid_input:
                    return "invalid input";
                case fsflow::errc::io_failure:
                    return "io failure";
                default:
                    return "unknown error";
            }
        }

        bool
        equivalent(const std::error_code& ec, int c) const noexcept override final
        {
            if (!ec)
            {
                return false;
            }

            switch (static_cast<fsflow::errc>(c))
            {
                case fsflow::errc::invalid_input:
                    return ec.category() == fsflow::error_category();
                case fsflow::errc::io_failure:
                    return ec.category() != fsflow::error_category();
                default:
                    return false;
            }
        }
    };
    static const category instance{};
    return instance;
}
