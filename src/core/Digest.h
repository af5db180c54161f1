#pragma once
#include <optional>
#include <string>

namespace skill_scan {

// Lower-case hex digests via OpenSSL EVP. Throw std::runtime_error if the digest cannot be computed.
std::string sha1_hex(const std::string& data);
std::string sha256_hex(const std::string& data);

// "<rule_id>_<8 hex>" from SHA-1 over "rule_id:file_path:line:evidence"; a missing line renders as "None".
std::string make_finding_id(const std::string& rule_id, const std::string& file_path,
                            std::optional<int> line_start, const std::string& evidence);

// SHA-256 of the instruction document after normalizing line endings to \n.
std::string content_hash(const std::string& text);

}
