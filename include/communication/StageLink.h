/**
 * StageLink.h - Request/response channel to the stage controller box
 *
 * The controller only answers; it never pushes. One textual command in, one
 * textual reply out:
 *   - ""            → command acknowledged
 *   - "12345"       → numeric reply (reads)
 *   - anything else → command rejected (reason text from the firmware)
 *   - LinkError     → controller unreachable / I/O failure
 *
 * The physical transport (serial, I2C bridge, TCP) lives behind this
 * interface and is not part of this project. SimulatedStage implements it
 * for the self-test and the tests.
 */

#pragma once

#include <stdexcept>
#include <string>

/**
 * Thrown by StageLink implementations on transport failure
 */
class LinkError : public std::runtime_error {
public:
    explicit LinkError(const std::string& what) : std::runtime_error(what) {}
};

class StageLink {
public:
    virtual ~StageLink() = default;

    /**
     * Send one command and return the controller's reply
     * @param command Command text without terminator (e.g. "l1")
     * @return Reply text, possibly empty
     * @throws LinkError if the controller could not be reached
     */
    virtual std::string transact(const std::string& command) = 0;
};
