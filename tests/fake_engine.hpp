// tests/fake_engine.hpp
// -----------------------------------------------------------------------------
// Stand-in engines for the process level tests: /bin/sh scripts written to a
// per-test temporary directory. POSIX only.
// -----------------------------------------------------------------------------
#ifndef PRINCE_TESTS_FAKE_ENGINE_HPP
#define PRINCE_TESTS_FAKE_ENGINE_HPP

#if !defined(_WIN32)

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>

#include <unistd.h>

namespace fs = std::filesystem;

// Writes every argument as "dat|arg|<value>", then reports success.
static const char* const ARGV_ECHO_ENGINE =
    "for a in \"$@\"; do printf 'dat|arg|%s\\n' \"$a\" >&2; done\n"
    "echo 'fin|success' >&2\n";

// Copies stdin to stdout.
static const char* const CAT_ENGINE =
    "cat\n"
    "echo 'msg|inf||copied' >&2\n"
    "echo 'fin|success' >&2\n";

class EngineTest : public ::testing::Test
{
protected:
    fs::path dir;

    void SetUp() override
    {
        const ::testing::TestInfo* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir = fs::temp_directory_path() /
              ("princecpp_" + std::to_string(::getpid()) + "_" +
               info->test_suite_name() + "_" + info->name());
        fs::remove_all(dir);
        fs::create_directories(dir);
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    // Executable /bin/sh script with the given body.
    std::string engine(const std::string& name, const std::string& body)
    {
        fs::path p = dir / name;
        {
            std::ofstream f(p, std::ios::binary);
            f << "#!/bin/sh\n" << body;
        }
        fs::permissions(p, fs::perms::owner_all |
                           fs::perms::group_read | fs::perms::group_exec |
                           fs::perms::others_read | fs::perms::others_exec);
        return p.string();
    }

    std::string file(const std::string& name, const std::string& content)
    {
        fs::path p = dir / name;
        std::ofstream f(p, std::ios::binary);
        f << content;
        return p.string();
    }

    static std::string slurp(const std::string& path)
    {
        std::ifstream f(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
    }
};

#endif // !defined(_WIN32)

#endif // PRINCE_TESTS_FAKE_ENGINE_HPP
