#include "FormData.hpp"

#include <filesystem>

namespace mtc {

httplib::MultipartFormDataItem form_field(const std::string& name, std::string_view value) {
  httplib::MultipartFormDataItem item;
  item.name = name;
  item.content = std::string(value);
  return item;
}

httplib::MultipartFormDataItem form_file(const std::string& name,
                                         const std::string& filename,
                                         const std::string& contentType,
                                         std::string_view bytes) {
  httplib::MultipartFormDataItem item;
  item.name = name;
  item.content = std::string(bytes);
  item.filename = std::filesystem::path(filename).filename().string();
  item.content_type = contentType.empty() ? "application/octet-stream" : contentType;
  return item;
}

EncodedForm encode_form(const httplib::MultipartFormDataItems& items) {
  const std::string boundary = httplib::detail::make_multipart_data_boundary();
  return EncodedForm{
    httplib::detail::serialize_multipart_formdata(items, boundary),
    "multipart/form-data; boundary=" + boundary
  };
}

} // namespace mtc
