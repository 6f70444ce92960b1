// Parses and normalizes scheme-qualified path strings into TransferPath values.
// Tolerates output of naive string concatenation: backslashes, "scheme:/host",
// and duplicated slashes.
#pragma once
#include "TransferPath.hpp"
#include <optional>
#include <string>

namespace openxfer {

class PathResolver {
public:
    static constexpr std::uint16_t kDefaultSmbPort  = 445;
    static constexpr std::uint16_t kDefaultSftpPort = 22;
    static constexpr std::uint16_t kDefaultFtpPort  = 21;

    // Deterministic and idempotent.
    static std::string normalize(const std::string& raw);

    // Returns nullopt and fills err on malformed input.
    static std::optional<TransferPath> resolve(const std::string& raw, std::string& err);
};

} // namespace openxfer
