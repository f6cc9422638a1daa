// tests/test_main.cpp
//
// IMPORTANT:
//   This must be the ONLY translation unit in the test executable that defines
//   DOCTEST_CONFIG_IMPLEMENT (or DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN).
//   All other test .cpp files should just include doctest WITHOUT those macros.
//
// We use DOCTEST_CONFIG_IMPLEMENT (instead of ...WITH_MAIN) so we can customize
// defaults, quiet the engine logger and still support doctest command-line flags.
#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#undef DOCTEST_CONFIG_IMPLEMENT

#include <cstdlib> // std::getenv
#include <cstring> // std::strcmp

#include <spdlog/spdlog.h>

namespace {

bool env_truthy(const char* v) {
    // Treat any non-empty value except "0" as true (sufficient for typical CI env vars).
    return v != nullptr && v[0] != '\0' && std::strcmp(v, "0") != 0;
}

bool running_in_ci() {
    // Common CI environment variables across popular CI providers.
    return env_truthy(std::getenv("CI")) ||
           env_truthy(std::getenv("GITHUB_ACTIONS")) ||
           env_truthy(std::getenv("GITLAB_CI"));
}

} // namespace

int main(int argc, char** argv) {
    doctest::Context context;

    // ----- sane defaults (can be overridden by CLI flags) -----
    context.setOption("order-by", "name");        // deterministic ordering
    context.setOption("duration", true);          // show timings (helps spot slow tests)

    // CI defaults: avoid debug breaks & ANSI color noise in logs.
    if (running_in_ci()) {
        context.setOption("no-breaks", true);
        context.setOption("no-colors", true);
    }

    // Warnings from intentionally broken inputs would drown the report.
    // ROCKETRUN_TEST_LOG=1 brings them back.
    if (!env_truthy(std::getenv("ROCKETRUN_TEST_LOG")))
        spdlog::set_level(spdlog::level::err);

    // Let command-line arguments override the defaults above.
    context.applyCommandLine(argc, argv);

    const int res = context.run();

    spdlog::shutdown();
    return res;
}
