#pragma once
#include <stdexcept>
#include <string>
#include <utility>

namespace mtc {

// Base of every failure raised by the transfer protocols. status() is the
// HTTP status when one was received (0 otherwise); body() is the raw
// response text kept for diagnostics.
class MediaError : public std::runtime_error {
public:
  MediaError(const std::string& what, int status = 0, std::string body = {})
    : std::runtime_error(what), status_(status), body_(std::move(body)) {}

  int status() const noexcept { return status_; }
  const std::string& body() const noexcept { return body_; }

private:
  int status_;
  std::string body_;
};

// Network failure or non-2xx HTTP status.
class TransportError : public MediaError {
public:
  using MediaError::MediaError;
};

// Response body could not be parsed into the expected shape.
class DecodeError : public MediaError {
public:
  using MediaError::MediaError;
};

// Well-formed response missing a required field (id, h, url).
class ProtocolError : public MediaError {
public:
  using MediaError::MediaError;
};

// Remote explicitly reported failure (success=false, or the object is gone).
class RejectedResult : public MediaError {
public:
  using MediaError::MediaError;
};

} // namespace mtc
