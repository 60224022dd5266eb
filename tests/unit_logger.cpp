// SPDX-License-Identifier: Apache-2.0
// unit_logger.cpp
// Formatting, level filtering, and no lost records when shutdown races a producer.
#include "common/logger.hpp"

#include <cassert>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

static size_t count_of(const std::string &hay, const std::string &needle)
{
    size_t n = 0;
    for (size_t pos = hay.find(needle); pos != std::string::npos; pos = hay.find(needle, pos + needle.size()))
        ++n;
    return n;
}

int main()
{
    using blob::log::detail::format;
    assert(format("plain") == "plain");
    assert(format("a {} b {}", 1, "x") == "a 1 b x");
    assert(format("{}", true) == "true");
    assert(format("{}", 1.5f) == "1.500");
    assert(format("x={}", 1, 2) == "x=1 2");
    assert(format("{} {}", std::string("s")) == "s {}");

    unsetenv("BLOB_LOG_LEVEL");
    unsetenv("BLOB_LOG_JSON");
    std::ostringstream captured;
    auto *saved = std::cerr.rdbuf(captured.rdbuf());

    blob::log::init();
    blob::log::info("before {}", 1);
    blob::log::debug("filtered out");
    constexpr int kLines = 2000;
    std::thread producer([] {
        for (int i = 0; i < kLines; ++i)
            blob::log::info("line {}", i);
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
    blob::log::shutdown();
    producer.join();
    // Writer is gone: records are written synchronously instead of dropped.
    blob::log::warn("after shutdown");
    blob::log::set_level(blob::log::level::error);
    blob::log::warn("below threshold");

    std::cerr.rdbuf(saved);
    std::string out = captured.str();
    assert(count_of(out, "] line ") == static_cast<size_t>(kLines));
    assert(out.find("[I ") != std::string::npos);
    assert(out.find("before 1") != std::string::npos);
    assert(out.find("after shutdown") != std::string::npos);
    assert(out.find("[W ") != std::string::npos);
    assert(out.find("filtered out") == std::string::npos);
    assert(out.find("below threshold") == std::string::npos);
    std::cout << "unit_logger OK" << std::endl;
    return 0;
}
