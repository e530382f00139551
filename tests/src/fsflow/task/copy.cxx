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

#include <chrono>
#include <filesystem>
#include <string>
#include <system_error>

#include <doctest/doctest.h>

#include "fsflow/error.hxx"
#include "fsflow/task/task.hxx"

#include "fsflow/scratch.hxx"

TEST_SUITE("fsflow::task" * doctest::description(""))
{
    TEST_CASE("copy")
    {
        scratch_directory scratch("task/copy");
        const auto& root = scratch.path;

        SUBCASE("initialization")
        {
            fsflow::copy task("source", "target");
            CHECK_EQ(task.source_path(), "source");
            CHECK_EQ(task.target_path(), "target");
            CHECK_EQ(task.name(), "copy");

            fsflow::copy empty;
            CHECK_EQ(empty.source_path(), "");
            CHECK_EQ(empty.target_path(), "");
        }

        SUBCASE("error empty source")
        {
            fsflow::copy task;
            const auto result = task.run();

            REQUIRE_FALSE(result.has_value());
            CHECK(result.error() == fsflow::error_code::missing_source_path);
            CHECK(result.error() == fsflow::errc::invalid_input);
            CHECK(result.error().message().contains("source_path"));
        }

        SUBCASE("error empty target")
        {
            fsflow::copy task("lala");
            const auto result = task.run();

            REQUIRE_FALSE(result.has_value());
            CHECK(result.error() == fsflow::error_code::missing_target_path);
            CHECK(result.error() == fsflow::errc::invalid_input);
            CHECK(result.error().message().contains("target_path"));
        }

        SUBCASE("error preserve-root source")
        {
            fsflow::copy task("/", (root / "out").string());
            const auto result = task.run();

            REQUIRE_FALSE(result.has_value());
            CHECK(result.error() == fsflow::error_code::root_preserve_source);
            CHECK_FALSE(std::filesystem::exists(root / "out"));
        }

        SUBCASE("file to directory")
        {
            std::filesystem::create_directories(root / "source");
            const auto source = root / "source" / "test";
            write_file(source, "test");

            fsflow::copy task(source.string(), root.string());
            const auto result = task.run();

            REQUIRE(result.has_value());
            CHECK_EQ(*result, root / "test");
            CHECK(std::filesystem::is_regular_file(root / "test"));
            CHECK_EQ(read_file(root / "test"), "test");
            CHECK(std::filesystem::exists(source));
            CHECK_EQ(read_file(source), "test");
        }

        SUBCASE("file to file")
        {
            std::filesystem::create_directories(root / "source");
            const auto source = root / "source" / "test";
            write_file(source, "test");
            const auto target = root / "out";

            fsflow::copy task(source.string(), target.string());
            const auto result = task.run();

            REQUIRE(result.has_value());
            CHECK_EQ(*result, target);
            CHECK(std::filesystem::is_regular_file(target));
            CHECK_EQ(read_file(target), "test");
            CHECK(std::filesystem::exists(source));
        }

        SUBCASE("file overwrites existing file")
        {
            std::filesystem::create_directories(root / "source");
            const auto source = root / "source" / "test";
            write_file(source, "new");
            const auto target = root / "out";
            write_file(target, "old contents");

            fsflow::copy task(source.string(), target.string());
            const auto result = task.run();

            REQUIRE(result.has_value());
            CHECK_EQ(read_file(target), "new");
        }

        SUBCASE("file keeps permissions and modification time")
        {
            std::filesystem::create_directories(root / "source");
            const auto source = root / "source" / "test";
            write_file(source, "#!/bin/sh\n");
            const auto perms = std::filesystem::perms::owner_read |
                               std::filesystem::perms::owner_write |
                               std::filesystem::perms::owner_exec;
            std::filesystem::permissions(source, perms);
            const auto mtime = std::filesystem::last_write_time(source) - std::chrono::hours(24);
            std::filesystem::last_write_time(source, mtime);

            fsflow::copy task(source.string(), (root / "out").string());
            const auto result = task.run();

            REQUIRE(result.has_value());
            CHECK(std::filesystem::status(*result).permissions() == perms);
            CHECK(std::filesystem::last_write_time(*result) == mtime);
        }

        SUBCASE("directory to new directory")
        {
            const auto source = root / "source" / "test";
            std::filesystem::create_directories(source);

            fsflow::copy task(source.string(), (root / "test2").string());
            const auto result = task.run();

            REQUIRE(result.has_value());
            CHECK_EQ(*result, root / "test2");
            CHECK(std::filesystem::is_directory(root / "test2"));
            CHECK(std::filesystem::is_directory(source));
        }

        SUBCASE("directory to existing directory")
        {
            const auto source = root / "source" / "test";
            std::filesystem::create_directories(source);

            fsflow::copy task(source.string(), root.string());
            const auto result = task.run();

            REQUIRE(result.has_value());
            CHECK_EQ(*result, root / "test");
            CHECK(std::filesystem::is_directory(root / "test"));
            CHECK(std::filesystem::is_directory(source));
        }

        SUBCASE("directory tree")
        {
            const auto source = root / "source" / "tree";
            std::filesystem::create_directories(source / "a" / "b");
            std::filesystem::create_directories(source / "empty");
            write_file(source / "top", "top");
            write_file(source / "a" / "middle", "middle");
            write_file(source / "a" / "b" / "bottom", "bottom");
            std::filesystem::create_symlink("top", source / "link");

            fsflow::copy task(source.string(), (root / "copy").string());
            const auto result = task.run();

            REQUIRE(result.has_value());
            const auto& copy = *result;
            CHECK_EQ(read_file(copy / "top"), "top");
            CHECK_EQ(read_file(copy / "a" / "middle"), "middle");
            CHECK_EQ(read_file(copy / "a" / "b" / "bottom"), "bottom");
            CHECK(std::filesystem::is_directory(copy / "empty"));
            CHECK(std::filesystem::is_symlink(copy / "link"));
            CHECK_EQ(std::filesystem::read_symlink(copy / "link"), "top");

            CHECK_EQ(read_file(source / "a" / "b" / "bottom"), "bottom");
        }

        SUBCASE("directory keeps permissions")
        {
            const auto source = root / "source" / "locked";
            std::filesystem::create_directories(source);
            write_file(source / "file", "data");
            const auto perms = std::filesystem::perms::owner_read | std::filesystem::perms::owner_exec;
            std::filesystem::permissions(source, perms);

            fsflow::copy task(source.string(), (root / "copy").string());
            const auto result = task.run();

            REQUIRE(result.has_value());
            CHECK(std::filesystem::status(*result).permissions() == perms);
            CHECK_EQ(read_file(*result / "file"), "data");

            const auto all = std::filesystem::perms::owner_all;
            std::filesystem::permissions(source, all);
            std::filesystem::permissions(*result, all);
        }

        SUBCASE("error directory onto existing target")
        {
            const auto source = root / "source" / "test";
            std::filesystem::create_directories(source);
            write_file(source / "new", "new");
            std::filesystem::create_directories(root / "test");

            fsflow::copy task(source.string(), root.string());
            const auto result = task.run();

            REQUIRE_FALSE(result.has_value());
            CHECK(result.error() == std::errc::file_exists);
            CHECK(result.error() == fsflow::errc::io_failure);
            CHECK_FALSE(std::filesystem::exists(root / "test" / "new"));
        }

        SUBCASE("error directory into itself")
        {
            const auto source = root / "source";
            std::filesystem::create_directories(source);

            fsflow::copy task(source.string(), (source / "inner").string());
            const auto result = task.run();

            REQUIRE_FALSE(result.has_value());
            CHECK(result.error() == std::errc::invalid_argument);
            CHECK_FALSE(std::filesystem::exists(source / "inner"));
        }

        SUBCASE("error missing source")
        {
            fsflow::copy task((root / "missing").string(), (root / "out").string());
            const auto result = task.run();

            REQUIRE_FALSE(result.has_value());
            CHECK(result.error() == fsflow::errc::io_failure);
            CHECK_FALSE(std::filesystem::exists(root / "out"));
        }

        SUBCASE("run arguments override stored paths")
        {
            std::filesystem::create_directories(root / "source");
            const auto source = root / "source" / "test";
            write_file(source, "test");

            fsflow::copy task(source.string(), "stored-target");
            const auto result = task.run("", (root / "out").string());

            REQUIRE(result.has_value());
            CHECK_EQ(*result, root / "out");
            CHECK_EQ(task.target_path(), "stored-target");
        }
    }
}
