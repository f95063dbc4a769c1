#include <gtest/gtest.h>

#include <string>

#include "MockRequestExecutor.hpp"
#include "core/multipart/FormData.hpp"

TEST(FormDataTest, EncodesFieldsAndFileInOrder) {
  const std::string png("\x89PNG\0\x01", 6);
  const mtc::EncodedForm form = mtc::encode_form({
    mtc::form_field("messaging_product", "whatsapp"),
    mtc::form_file("file", "photo.png", "image/png", png)
  });

  const std::string boundary = form.contentType.substr(form.contentType.find("boundary=") + 9);
  ASSERT_EQ(form.contentType, "multipart/form-data; boundary=" + boundary);
  ASSERT_FALSE(boundary.empty());

  const std::string field =
    "--" + boundary + "\r\n"
    "Content-Disposition: form-data; name=\"messaging_product\"\r\n\r\nwhatsapp\r\n";
  const std::string file =
    "--" + boundary + "\r\n"
    "Content-Disposition: form-data; name=\"file\"; filename=\"photo.png\"\r\n"
    "Content-Type: image/png\r\n\r\n" + png + "\r\n";
  const std::string closing = "--" + boundary + "--\r\n";

  EXPECT_EQ(form.body.find(field), 0u);
  EXPECT_EQ(form.body.find(file), field.size());
  EXPECT_EQ(form.body.substr(form.body.size() - closing.size()), closing);
  EXPECT_EQ(mtc::test::part_content(form.body, form.contentType, "file"), png);
}

TEST(FormDataTest, FileNameIsReducedToBasename) {
  const auto item = mtc::form_file("file", "/var/tmp/uploads/report.pdf", "application/pdf", "%PDF");
  EXPECT_EQ(item.filename, "report.pdf");
  EXPECT_EQ(item.content_type, "application/pdf");
  EXPECT_EQ(item.content, "%PDF");
}

TEST(FormDataTest, MissingFileContentTypeFallsBackToOctetStream) {
  EXPECT_EQ(mtc::form_file("file", "blob", "", "x").content_type, "application/octet-stream");
}

TEST(FormDataTest, FieldsCarryNoFileHeaders) {
  const auto item = mtc::form_field("asset_type", "FLOW_JSON");
  EXPECT_TRUE(item.filename.empty());
  EXPECT_TRUE(item.content_type.empty());
}

TEST(FormDataTest, EachFormGetsItsOwnBoundary) {
  const auto a = mtc::encode_form({mtc::form_field("a", "1")});
  const auto b = mtc::encode_form({mtc::form_field("a", "1")});
  EXPECT_NE(a.contentType, b.contentType);
}
