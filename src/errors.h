#pragma once

#include <stdexcept>
#include <string>

// -----------------------------------------------------------------------
// Error types raised by the encoding core.
//
// All of them are detected before any frame reaches the device, so a
// failed command never leaves a half-written animation behind.
// -----------------------------------------------------------------------

// A color channel outside 0-255, or color text that cannot be parsed.
class InvalidColor : public std::runtime_error {
public:
    explicit InvalidColor(const std::string& what) : std::runtime_error(what) {}
};

// More colors than the controller has LEDs.
class TooManyColors : public std::runtime_error {
public:
    explicit TooManyColors(const std::string& what) : std::runtime_error(what) {}
};

// A mode parameter outside its allowed range, a wrong number of colors
// for a mode, or an option the mode does not take.
class InvalidParameter : public std::runtime_error {
public:
    explicit InvalidParameter(const std::string& what) : std::runtime_error(what) {}
};

// Mode name not present in the catalog.
class UnknownMode : public std::runtime_error {
public:
    explicit UnknownMode(const std::string& what) : std::runtime_error(what) {}
};
