#pragma once

#include <cstddef> // std::byte
#include <span>
#include <string>

using ByteSpan = std::span<std::byte>;
using ConstByteSpan = std::span<const std::byte>;

namespace shardsink {
/// Outcome of a single remote request.
enum class RequestStatus
{
    Success,
    NotFound,
    Failure
};

struct RequestResult
{
    RequestStatus status{ RequestStatus::Success };
    std::string message; // diagnostic, nonempty when status != Success

    [[nodiscard]] bool ok() const { return status == RequestStatus::Success; }
    [[nodiscard]] bool not_found() const
    {
        return status == RequestStatus::NotFound;
    }
};
} // namespace shardsink
