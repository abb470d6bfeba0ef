#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <curl/curl.h>
#include "spdlog/spdlog.h"
#include "spdlog/sinks/null_sink.h"

int main(int argc, char ** argv) {
    ::testing::InitGoogleMock(&argc, argv);

    // components look up the shared "logger" when they are constructed
    spdlog::create<spdlog::sinks::null_sink_mt>("logger");
    curl_global_init(CURL_GLOBAL_ALL);

    int result = RUN_ALL_TESTS();

    curl_global_cleanup();
    spdlog::drop_all();
    return result;
}
