/**
 * @file IdGenerator.hpp
 * @brief Event identifiers: a millisecond time prefix plus a random suffix.
 */

#pragma once

#include <chrono>
#include <string>

namespace spool::infrastructure {

class IdGenerator {
public:
    /**
     * @brief e.g. "0199f3a1c2d4-k3j9x0a7"
     *
     * The hex prefix keeps ids from one clock roughly sortable; the suffix
     * keeps two working copies writing in the same millisecond apart.
     */
    static std::string NewEventId(std::chrono::system_clock::time_point now);
};

} // namespace spool::infrastructure
