#pragma once
#include <string>
#include <string_view>

#include "core/transport/RequestExecutor.hpp"

namespace mtc {

class LocalFileSource;

// One-shot multipart upload to "<phone-number-id>/media".
class SimpleUpload {
public:
  explicit SimpleUpload(RequestExecutor& executor,
                        std::string messagingProduct = "whatsapp");

  // Returns the remote media id. Throws TransportError, DecodeError, or
  // ProtocolError when the response carries no id.
  std::string upload(const std::string& phoneNumberId,
                     std::string_view bytes,
                     const std::string& filename,
                     const std::string& mimeType);

  std::string uploadFile(const std::string& phoneNumberId,
                         const LocalFileSource& source,
                         const std::string& path,
                         const std::string& mimeType);

private:
  RequestExecutor& executor_;
  std::string messagingProduct_;
};

} // namespace mtc
