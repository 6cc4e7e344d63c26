// src/core/types.cpp
#include "core/types.hpp"

namespace panes {

const char* toString(OpenError e) {
  switch (e) {
    case OpenError::None: return "none";
    case OpenError::CannotOpen: return "cannot_open";
    case OpenError::PasswordRequired: return "password_required";
    case OpenError::WrongPassword: return "wrong_password";
    case OpenError::UnsupportedCompression: return "unsupported_compression";
    case OpenError::NoContentFound: return "no_content_found";
    case OpenError::NestedArchiveOpenFailed: return "nested_archive_open_failed";
  }
  return "cannot_open";
}

const char* toString(ArchiveFamily f) {
  switch (f) {
    case ArchiveFamily::Zip: return "zip";
    case ArchiveFamily::Rar: return "rar";
    case ArchiveFamily::SevenZip: return "7z";
  }
  return "zip";
}

std::string userMessage(OpenError e) {
  switch (e) {
    case OpenError::None: return "";
    case OpenError::CannotOpen: return "Cannot open file.";
    case OpenError::PasswordRequired: return "This archive is locked. Enter the password to open it.";
    case OpenError::WrongPassword: return "The password is incorrect.";
    case OpenError::UnsupportedCompression: return "This archive uses a compression method that is not supported.";
    case OpenError::NoContentFound: return "No images were found in this file.";
    case OpenError::NestedArchiveOpenFailed: return "An archive inside this file could not be opened.";
  }
  return "Cannot open file.";
}

} // namespace panes
