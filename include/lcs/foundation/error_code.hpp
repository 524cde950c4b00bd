#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes and their mapping onto the lobby
///        protocol's error taxonomy.

#include <cstdint>
#include <string_view>

namespace lcs::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), making it possible
/// to determine the error source from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,
    NotImplemented = 0x0005,

    // Network / protocol (0x0100 - 0x01FF)
    InvalidMessage = 0x0100,
    UnknownOpcode = 0x0101,

    // Auth (0x0500 - 0x05FF)
    PermissionDenied = 0x0500,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,
    ConfigInvalidValue = 0x0603,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerFlushFailed = 0x0801,

    // Lobby (0x0A00 - 0x0AFF)
    CoordinatorNotStarted = 0x0A00,
    CoordinatorAlreadyStarted = 0x0A01,
    UnknownLobbyFactory = 0x0A02,
    InvalidLobbyOptions = 0x0A03,
    LobbyIdCollision = 0x0A04,
    LobbyNotFound = 0x0A05,
    LobbyFull = 0x0A06,
    LobbyNotAccepting = 0x0A07,
    AlreadyInLobby = 0x0A08,
    NotInLobby = 0x0A09,
    AlreadyLobbyMember = 0x0A0A,
    NotLobbyMember = 0x0A0B,
    NotLobbyOwner = 0x0A0C,
    PropertyRejected = 0x0A0D,
    TeamNotFound = 0x0A0E,
    TeamFull = 0x0A0F,
    TeamSwitchForbidden = 0x0A10,
    StartConditionsNotMet = 0x0A11,
    GameNotStarted = 0x0A12,
    LobbyRegistrationFailed = 0x0A13,

    // Provisioning (0x0B00 - 0x0BFF)
    ProvisionerUnavailable = 0x0B00,
    ProvisioningFailed = 0x0B01,
    ProvisioningTimeout = 0x0B02,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Network";
        case 0x0500: return "Auth";
        case 0x0600: return "Config";
        case 0x0800: return "Logger";
        case 0x0A00: return "Lobby";
        case 0x0B00: return "Provisioning";
        default: return "Unknown";
    }
}

/// Error classes a request handler reports back to the caller.
enum class ErrorKind : uint8_t {
    None,            ///< Not an error.
    Unauthorized,    ///< Insufficient permission or authority.
    InvalidRequest,  ///< Malformed payload, missing field, unknown factory.
    Conflict,        ///< Already in a lobby, lobby full, id collision, bad state.
    NotFound,        ///< Lobby, member or team absent.
    Internal         ///< Registration or downstream provisioning failure.
};

/// Classify an error code into the protocol's error taxonomy.
constexpr ErrorKind errorKind(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success:
            return ErrorKind::None;

        case ErrorCode::PermissionDenied:
        case ErrorCode::NotLobbyOwner:
            return ErrorKind::Unauthorized;

        case ErrorCode::InvalidArgument:
        case ErrorCode::InvalidMessage:
        case ErrorCode::UnknownOpcode:
        case ErrorCode::UnknownLobbyFactory:
        case ErrorCode::InvalidLobbyOptions:
        case ErrorCode::PropertyRejected:
        case ErrorCode::ConfigTypeMismatch:
        case ErrorCode::ConfigInvalidValue:
            return ErrorKind::InvalidRequest;

        case ErrorCode::AlreadyExists:
        case ErrorCode::CoordinatorAlreadyStarted:
        case ErrorCode::LobbyIdCollision:
        case ErrorCode::LobbyFull:
        case ErrorCode::LobbyNotAccepting:
        case ErrorCode::AlreadyInLobby:
        case ErrorCode::AlreadyLobbyMember:
        case ErrorCode::TeamFull:
        case ErrorCode::TeamSwitchForbidden:
        case ErrorCode::StartConditionsNotMet:
        case ErrorCode::GameNotStarted:
            return ErrorKind::Conflict;

        case ErrorCode::NotFound:
        case ErrorCode::ConfigKeyNotFound:
        case ErrorCode::LobbyNotFound:
        case ErrorCode::NotInLobby:
        case ErrorCode::NotLobbyMember:
        case ErrorCode::TeamNotFound:
            return ErrorKind::NotFound;

        default:
            return ErrorKind::Internal;
    }
}

/// Return the string name for an error kind.
constexpr std::string_view errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:           return "None";
        case ErrorKind::Unauthorized:   return "Unauthorized";
        case ErrorKind::InvalidRequest: return "InvalidRequest";
        case ErrorKind::Conflict:       return "Conflict";
        case ErrorKind::NotFound:       return "NotFound";
        case ErrorKind::Internal:       return "Internal";
    }
    return "Unknown";
}

} // namespace lcs::foundation
