#pragma once

#include <stdexcept>
#include <string>

namespace sengled {

// Base for every error raised by this library
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// HTTP, TLS, DNS and MQTT connect failures, non-2xx status, undecodable response body
class TransportError : public Error {
public:
    explicit TransportError(const std::string& what) : Error(what) {}
};

// A single MQTT publish did not complete
class PublishError : public TransportError {
public:
    explicit PublishError(const std::string& what) : TransportError(what) {}
};

// Login was answered with anything other than a session id
class AuthenticationFailure : public Error {
public:
    AuthenticationFailure() : Error("authentication failed") {}
};

class SerializationError : public Error {
public:
    explicit SerializationError(const std::string& what) : Error(what) {}
};

class InvalidIdentifier : public Error {
public:
    explicit InvalidIdentifier(const std::string& what) : Error(what) {}
};

// Device list response could not be turned into devices; no partial list is returned
class DirectoryError : public Error {
public:
    explicit DirectoryError(const std::string& what) : Error(what) {}
};

class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& what) : Error(what) {}
};

} // namespace sengled
