// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_bridge Team

#include "archive_bridge/archive_format.h"
#include "archive_bridge/entry.h"

namespace archive_bridge {

const char *to_string(ArchiveFormat format) {
  switch (format) {
  case ArchiveFormat::Zip:
    return "zip";
  case ArchiveFormat::SevenZip:
    return "7zip";
  case ArchiveFormat::Tar:
    return "tar";
  case ArchiveFormat::Ustar:
    return "ustar";
  case ArchiveFormat::Pax:
    return "pax";
  case ArchiveFormat::Cpio:
    return "cpio";
  case ArchiveFormat::Iso9660:
    return "iso9660";
  case ArchiveFormat::Xar:
    return "xar";
  }
  return "unknown";
}

const char *to_string(CompressionType compression) {
  switch (compression) {
  case CompressionType::None:
    return "none";
  case CompressionType::Gzip:
    return "gzip";
  case CompressionType::Bzip2:
    return "bzip2";
  case CompressionType::Xz:
    return "xz";
  case CompressionType::Lzma:
    return "lzma";
  case CompressionType::Lz4:
    return "lz4";
  case CompressionType::Zstd:
    return "zstd";
  case CompressionType::Compress:
    return "compress";
  case CompressionType::Lzip:
    return "lzip";
  case CompressionType::Deflate:
    return "deflate";
  }
  return "unknown";
}

const char *to_string(EncryptionType encryption) {
  switch (encryption) {
  case EncryptionType::Default:
    return "default";
  case EncryptionType::None:
    return "none";
  case EncryptionType::Traditional:
    return "traditional";
  case EncryptionType::AES128:
    return "aes128";
  case EncryptionType::AES192:
    return "aes192";
  case EncryptionType::AES256:
    return "aes256";
  case EncryptionType::ZipCrypto:
    return "zipcrypto";
  }
  return "unknown";
}

const char *to_string(EntryType type) {
  switch (type) {
  case EntryType::Directory:
    return "directory";
  case EntryType::RegularFile:
    return "file";
  case EntryType::Symlink:
    return "symlink";
  case EntryType::Other:
    return "other";
  }
  return "other";
}

} // namespace archive_bridge
