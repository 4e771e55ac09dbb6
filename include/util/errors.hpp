#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace tl {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}

    // Stable name used in cycle reports and on the wire.
    [[nodiscard]] virtual std::string_view kind() const noexcept { return "Error"; }
};

#define TL_DEFINE_ERROR(Name)                                                          \
    class Name : public Error {                                                        \
    public:                                                                            \
        explicit Name(const std::string& what) : Error(what) {}                        \
        [[nodiscard]] std::string_view kind() const noexcept override { return #Name; } \
    }

// Root missing or unreadable. Fatal for the cycle.
TL_DEFINE_ERROR(EnumerationError);

// Received bytes do not hash to the claimed digest. Rejects one path.
TL_DEFINE_ERROR(HashMismatchError);

// Connection failure, timeout or retryable server status.
TL_DEFINE_ERROR(TransientNetworkError);

// Never recovered by sending plaintext.
TL_DEFINE_ERROR(EncryptionError);

// A single line exceeded the chunk budget. Recorded as a warning.
TL_DEFINE_ERROR(ChunkTooLargeError);

// Retryable per chunk.
TL_DEFINE_ERROR(EmbeddingProviderError);

// Malformed request, unknown session, or path outside the negotiated change-set.
TL_DEFINE_ERROR(ProtocolError);

// Received or persisted snapshot fails hash verification.
TL_DEFINE_ERROR(SnapshotError);

// Stop requested while a cycle was in flight.
TL_DEFINE_ERROR(CancelledError);

#undef TL_DEFINE_ERROR

}
