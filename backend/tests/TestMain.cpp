#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "TestUtils.hpp"

#include "utils/Log.hpp"

#include <filesystem>
#include <system_error>

int main(int argc, char **argv)
{
    auto log_path = tmax::test::test_log_path();
    std::error_code ec;
    std::filesystem::create_directories(log_path.parent_path(), ec);
    tmax::log::set_log_file(log_path.string());

    doctest::Context context;
    context.applyCommandLine(argc, argv);
    return context.run();
}
