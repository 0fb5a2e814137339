#pragma once

#include <string>

namespace sage_core {

// 128 random bits from the OpenSSL CSPRNG as 32 lowercase hex characters.
std::string generate_document_id();

// Hex SHA-256 of the raw document text.
std::string compute_content_hash(const std::string &content);

}  // namespace sage_core
