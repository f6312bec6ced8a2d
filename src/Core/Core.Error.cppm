module;

#include <cstdint>
#include <string_view>
#include <expected>
#include <utility>

export module Core:Error;

export namespace Core
{
    // -------------------------------------------------------------------------
    // Error Handling Strategy
    // -------------------------------------------------------------------------
    // 1. std::expected<T, E>  - For FALLIBLE operations where failure is expected
    //                          and the caller MUST handle it. Use when:
    //                          - Creating driver objects (pools, buffers, fences)
    //                          - Polling or waiting on GPU completion
    //                          - Reading back query results
    //
    // 2. std::optional<T>    - For QUERIES where "not found" is a valid outcome,
    //                          e.g. memory type lookups and cache misses.
    //
    // 3. Raw pointers (T*)   - ONLY for non-owning observation of existing objects.
    //                          NEVER return raw pointers for newly allocated resources!
    //
    // 4. Assertions          - For INVARIANTS that should never be violated
    //                          (cache key mismatch, double release, recording on a
    //                          submitted command buffer). A violation is a bug.
    //
    // Destructors never propagate errors. Failures during teardown are logged
    // and swallowed.
    // -------------------------------------------------------------------------

    enum class ErrorCode : uint32_t
    {
        Success = 0,

        // Resource errors (100-199)
        OutOfMemory = 100,
        ResourceNotFound = 101,
        ResourceBusy = 102,

        // I/O errors (200-299)
        FileNotFound = 200,
        FileReadError = 201,

        // Validation errors (300-399)
        InvalidArgument = 300,
        InvalidState = 301,
        InvalidData = 302,

        // Driver errors (400-499)
        DeviceLost = 400,
        OutOfDeviceMemory = 401,
        OutOfPoolMemory = 402,
        Unsupported = 403,
        NotReady = 404,

        // Generic
        Unknown = 999
    };

    constexpr std::string_view ErrorCodeToString(ErrorCode code)
    {
        switch (code)
        {
            case ErrorCode::Success:            return "Success";
            case ErrorCode::OutOfMemory:        return "OutOfMemory";
            case ErrorCode::ResourceNotFound:   return "ResourceNotFound";
            case ErrorCode::ResourceBusy:       return "ResourceBusy";
            case ErrorCode::FileNotFound:       return "FileNotFound";
            case ErrorCode::FileReadError:      return "FileReadError";
            case ErrorCode::InvalidArgument:    return "InvalidArgument";
            case ErrorCode::InvalidState:       return "InvalidState";
            case ErrorCode::InvalidData:        return "InvalidData";
            case ErrorCode::DeviceLost:         return "DeviceLost";
            case ErrorCode::OutOfDeviceMemory:  return "OutOfDeviceMemory";
            case ErrorCode::OutOfPoolMemory:    return "OutOfPoolMemory";
            case ErrorCode::Unsupported:        return "Unsupported";
            case ErrorCode::NotReady:           return "NotReady";
            case ErrorCode::Unknown:            return "Unknown";
        }
        return "Unknown";
    }

    // A lost device ends the session. Callers must stop issuing GPU work.
    [[nodiscard]] constexpr bool IsFatal(ErrorCode code) noexcept
    {
        return code == ErrorCode::DeviceLost;
    }

    template<typename T>
    using Expected = std::expected<T, ErrorCode>;

    template<typename T>
    constexpr Expected<T> Ok(T&& value)
    {
        return Expected<T>(std::forward<T>(value));
    }

    template<typename T>
    constexpr Expected<T> Err(ErrorCode code)
    {
        return std::unexpected(code);
    }

    // Void success type for operations that don't return a value
    struct Unit {};
    inline constexpr Unit unit{};

    using Result = Expected<Unit>;

    constexpr Result Ok()
    {
        return Result(unit);
    }

    constexpr Result Err(ErrorCode code)
    {
        return std::unexpected(code);
    }
}
