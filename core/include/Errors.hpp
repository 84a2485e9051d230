#pragma once
#include <stdexcept>
#include <string>

namespace Jukebox {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Thrown while building the configuration hierarchy
class ConfigError : public Error {
public:
    using Error::Error;
};

// Malformed "H:M:S" time string
class FormatError : public ConfigError {
public:
    using ConfigError::ConfigError;
};

// Group or track list index outside the configured range
class IndexError : public Error {
public:
    using Error::Error;
};

/**
 * Errors raised inside a playback session.
 * They never leave the session thread: the session logs them and
 * terminates through its regular teardown.
 */
class SessionError : public Error {
public:
    using Error::Error;
};

class DirectoryError : public SessionError {
public:
    using SessionError::SessionError;
};

class FileNotFoundError : public SessionError {
public:
    using SessionError::SessionError;
};

class EngineStartError : public SessionError {
public:
    using SessionError::SessionError;
};

} // namespace Jukebox
