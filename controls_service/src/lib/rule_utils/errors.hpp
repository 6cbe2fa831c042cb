#pragma once

#include <stdexcept>
#include <string>

namespace payment_controls {

// Required input file or required column is absent.
class MissingInputError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Input is present but cannot be used as a batch (bad required cell,
// duplicate transaction id, ragged CSV row).
class InvalidInputError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Control set cannot be loaded or compiled.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}  // namespace payment_controls
