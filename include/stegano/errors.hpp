#pragma once

#include <stdexcept>
#include <string>

namespace stegano {

// Stream identity failures: bad signature, missing terminal or synthetic record.
class MalformedContainer : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Open/create failures and short reads or writes in byte-exact phases.
class IoError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Bad selectors, keys, offsets and payload sizes.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}  // namespace stegano
