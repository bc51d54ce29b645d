#include "hitlgate/dialog/attachment_loader.hpp"

#include "hitlgate/common/fs.hpp"

#include <openssl/evp.h>

#include <vector>

namespace hitlgate::dialog {

std::string image_mime_type(const std::filesystem::path &path) {
  const std::string ext = common::to_lower(path.extension().string());
  if (ext == ".jpg" || ext == ".jpeg") {
    return "image/jpeg";
  }
  if (ext == ".gif") {
    return "image/gif";
  }
  if (ext == ".webp") {
    return "image/webp";
  }
  if (ext == ".svg") {
    return "image/svg+xml";
  }
  if (ext == ".bmp") {
    return "image/bmp";
  }
  return "image/png";
}

std::string base64_encode(const std::string &bytes) {
  if (bytes.empty()) {
    return "";
  }
  std::vector<unsigned char> out(4 * ((bytes.size() + 2) / 3) + 1);
  const int written = EVP_EncodeBlock(out.data(),
                                      reinterpret_cast<const unsigned char *>(bytes.data()),
                                      static_cast<int>(bytes.size()));
  return std::string(reinterpret_cast<const char *>(out.data()),
                     static_cast<std::size_t>(written));
}

common::Result<Attachment> load_attachment(const AttachmentKind kind,
                                           const std::filesystem::path &path) {
  auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<Attachment>::failure(content.status());
  }

  Attachment attachment;
  attachment.kind = kind;
  attachment.name = path.filename().string();
  if (kind == AttachmentKind::Image) {
    const std::string mime = image_mime_type(path);
    attachment.mime_type = mime;
    attachment.content = "data:" + mime + ";base64," + base64_encode(content.value());
  } else {
    attachment.content = std::move(content.value());
  }
  return common::Result<Attachment>::success(std::move(attachment));
}

} // namespace hitlgate::dialog
