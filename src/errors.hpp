#pragma once

#include <stdexcept>
#include <string>

// index.mth bytes without the MTHS 0.1 header.
class IndexFormatError : public std::runtime_error {
public:
  explicit IndexFormatError(const std::string& what) : std::runtime_error(what) {}
};

// Resolve, connect, TLS, timeout, bad status or truncated body.
class TransportError : public std::runtime_error {
public:
  explicit TransportError(const std::string& what) : std::runtime_error(what) {}
};

// Destination listing, read, write or delete failure.
class FilesystemError : public std::runtime_error {
public:
  explicit FilesystemError(const std::string& what) : std::runtime_error(what) {}
};
