#pragma once
#include <cstdint>
#include <string>
#include <string_view>

#include "MediaTypes.hpp"
#include "core/transport/ClientConfig.hpp"
#include "core/transport/RequestExecutor.hpp"

namespace mtc {

// Session-based upload producing a reusable media handle.
//
//   Uninitialized --createSession--> SessionCreated --pushData--> Completed
//                                                   \-----------> Failed
//
// Session creation goes through the executor's default builder. The data
// push does not: it is sent with sendRaw() to the versioned URL built from
// the injected config, with an "OAuth" Authorization header and a
// file_offset header.
//
// Only a single push at offset 0 is exercised. A chunked variant would send
// bytes[offset..], keep the last acknowledged offset per session and
// serialize pushes to it.
class ResumableUpload {
public:
  ResumableUpload(RequestExecutor& executor, ClientConfig config);

  // POST <appId>/uploads {file_length, file_type}. Throws ProtocolError when
  // the response has no session id.
  UploadSession createSession(const std::string& appId,
                              int64_t length,
                              const std::string& mimeType);

  // Pushes the full payload with file_offset set to offset. Non-2xx ->
  // TransportError with status and body; missing "h" -> ProtocolError.
  MediaHandle pushData(const std::string& sessionId,
                       std::string_view bytes,
                       int64_t offset);

  // As above, but enforces single use of the session and the declared
  // length, and records the outcome in session.state.
  MediaHandle pushData(UploadSession& session,
                       std::string_view bytes,
                       int64_t offset = 0);

  // createSession + pushData at offset 0.
  MediaHandle upload(const std::string& appId,
                     std::string_view bytes,
                     const std::string& mimeType);

private:
  std::string token() const;

  RequestExecutor& executor_;
  ClientConfig config_;
};

} // namespace mtc
