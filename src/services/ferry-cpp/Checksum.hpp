#pragma once

#include <string>

// Lowercase hex SHA-256 of a file's contents. Throws std::runtime_error when
// the file cannot be read or the digest cannot be computed.
std::string Sha256File(const std::string& path);
