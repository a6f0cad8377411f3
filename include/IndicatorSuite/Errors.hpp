#pragma once

#include <stdexcept>
#include <string>

namespace indicators {

class IndicatorError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

// Bundle file could not be opened or read.
class BundleIOError : public IndicatorError {
  public:
    using IndicatorError::IndicatorError;
};

// Bundle is not valid JSON or lacks the top-level objects array.
class BundleParseError : public IndicatorError {
  public:
    using IndicatorError::IndicatorError;
};

// An indicator pattern does not split into one key/value pair.
class BundleSchemaError : public IndicatorError {
  public:
    using IndicatorError::IndicatorError;
};

class ConfigError : public IndicatorError {
  public:
    using IndicatorError::IndicatorError;
};

// An artifact module could not read its source.
class ModuleError : public IndicatorError {
  public:
    using IndicatorError::IndicatorError;
};

class InvalidUrlError : public IndicatorError {
  public:
    using IndicatorError::IndicatorError;
};

class NetworkError : public IndicatorError {
  public:
    using IndicatorError::IndicatorError;
};

class TimeoutError : public NetworkError {
  public:
    using NetworkError::NetworkError;
};

} // namespace indicators
