#pragma once

#include "hitlgate/common/result.hpp"
#include "hitlgate/dialog/types.hpp"

#include <filesystem>
#include <string>

namespace hitlgate::dialog {

/// Guess an image MIME type from the file extension (`image/png` when unknown).
[[nodiscard]] std::string image_mime_type(const std::filesystem::path &path);

[[nodiscard]] std::string base64_encode(const std::string &bytes);

/// Reads a local file into an attachment. Images become `data:<mime>;base64,...`; files and
/// code keep their text.
[[nodiscard]] common::Result<Attachment> load_attachment(AttachmentKind kind,
                                                         const std::filesystem::path &path);

} // namespace hitlgate::dialog
