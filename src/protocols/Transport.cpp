#include "protocols/Transport.hpp"
#include "util/errors.hpp"

#include <fmt/format.h>

void tl::protocols::rethrowRemoteError(const std::string_view kind, const std::string& message, const long status) {
    if (kind == "ProtocolError") throw ProtocolError(message);
    if (kind == "SnapshotError") throw SnapshotError(message);
    if (kind == "EncryptionError") throw EncryptionError(message);
    if (kind == "HashMismatchError") throw HashMismatchError(message);
    if (kind == "EnumerationError") throw EnumerationError(message);
    if (kind == "EmbeddingProviderError") throw EmbeddingProviderError(message);
    if (kind == "CancelledError") throw CancelledError(message);
    if (status >= 400 && status < 500) throw ProtocolError(message);
    throw TransientNetworkError(fmt::format("Server error {} ({}): {}", status, kind.empty() ? "unknown" : kind, message));
}
