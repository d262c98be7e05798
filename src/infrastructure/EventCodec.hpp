/**
 * @file EventCodec.hpp
 * @brief JSON-lines encoding of task events.
 */

#pragma once

#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "domain/Diagnostic.hpp"
#include "domain/events/TaskEvents.hpp"

namespace spool::infrastructure {

/**
 * @class EventDecodeError
 * @brief A log line that cannot become an Event. Carries the diagnostic
 * category so callers can report it without re-inspecting the line.
 */
class EventDecodeError : public std::runtime_error {
public:
    EventDecodeError(domain::DiagnosticCategory category, const std::string& message)
        : std::runtime_error(message), m_category(category) {}

    domain::DiagnosticCategory category() const { return m_category; }

private:
    domain::DiagnosticCategory m_category;
};

class EventCodec {
public:
    /** @brief Envelope keys every line must carry. */
    static const char* const kRequiredFields[6];

    /** @brief Serializes to a single line without trailing newline. */
    static std::string Encode(const domain::Event& event);

    static nlohmann::json ToJson(const domain::Event& event);

    /**
     * @brief Parses one log line.
     * @throws EventDecodeError on malformed JSON or schema violations.
     */
    static domain::Event Decode(const std::string& line);

    /** @throws EventDecodeError */
    static domain::Event FromJson(const nlohmann::json& j);
};

} // namespace spool::infrastructure
