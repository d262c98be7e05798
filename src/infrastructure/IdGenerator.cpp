/**
 * @file IdGenerator.cpp
 * @brief Implementation of IdGenerator.
 */

#include "infrastructure/IdGenerator.hpp"

#include <cstdio>
#include <random>

namespace spool::infrastructure {

namespace {

std::mt19937_64& Engine() {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    return engine;
}

} // namespace

std::string IdGenerator::NewEventId(std::chrono::system_clock::time_point now) {
    static const char alphanum[] = "0123456789abcdefghijklmnopqrstuvwxyz";

    const long long ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count();
    char prefix[24];
    std::snprintf(prefix, sizeof(prefix), "%012llx", static_cast<unsigned long long>(ms));

    std::uniform_int_distribution<int> pick(0, static_cast<int>(sizeof(alphanum) - 2));
    std::string id(prefix);
    id += '-';
    for (int i = 0; i < 8; ++i) {
        id += alphanum[pick(Engine())];
    }
    return id;
}

} // namespace spool::infrastructure
