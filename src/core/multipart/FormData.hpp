#pragma once
#include <httplib.h>

#include <string>
#include <string_view>

namespace mtc {

struct EncodedForm {
  std::string body;
  std::string contentType;   // "multipart/form-data; boundary=..."
};

// Plain text part: no filename, no Content-Type.
httplib::MultipartFormDataItem form_field(const std::string& name, std::string_view value);

// File part; filename is reduced to its basename and an empty content type
// becomes application/octet-stream.
httplib::MultipartFormDataItem form_file(const std::string& name,
                                         const std::string& filename,
                                         const std::string& contentType,
                                         std::string_view bytes);

// Serializes the parts with httplib's multipart writer under a fresh boundary,
// ready for RequestExecutor::requestMultipart.
EncodedForm encode_form(const httplib::MultipartFormDataItems& items);

} // namespace mtc
