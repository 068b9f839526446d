#pragma once
#include <string>
#include <string_view>
namespace rdlink::protocol {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooSmall,
    BufferTooLarge,
    AllocationFailed,
    ReadOperationFailed,
    InvalidOperation
};
enum class ProtocolFailureType {
    Generic,
    InvalidInput,
    InvalidState,
    Encode,
    Decode,
    Handshake,
    KeyGeneration,
    Encryption,
    Decryption,
    Transport,
    Discovery,
    Timeout,
    ObjectDisposed,
    NullPointer
};
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure ReadOperationFailed(std::string msg) {
        return {SodiumFailureType::ReadOperationFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};
class ProtocolFailure {
public:
    ProtocolFailureType type;
    std::string message;
    ProtocolFailure(const ProtocolFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static ProtocolFailure Generic(std::string msg) {
        return {ProtocolFailureType::Generic, std::move(msg)};
    }
    static ProtocolFailure InvalidInput(std::string msg) {
        return {ProtocolFailureType::InvalidInput, std::move(msg)};
    }
    static ProtocolFailure InvalidState(std::string msg) {
        return {ProtocolFailureType::InvalidState, std::move(msg)};
    }
    static ProtocolFailure Encode(std::string msg) {
        return {ProtocolFailureType::Encode, std::move(msg)};
    }
    static ProtocolFailure Decode(std::string msg) {
        return {ProtocolFailureType::Decode, std::move(msg)};
    }
    static ProtocolFailure Handshake(std::string msg) {
        return {ProtocolFailureType::Handshake, std::move(msg)};
    }
    static ProtocolFailure KeyGeneration(std::string msg) {
        return {ProtocolFailureType::KeyGeneration, std::move(msg)};
    }
    static ProtocolFailure Encryption(std::string msg) {
        return {ProtocolFailureType::Encryption, std::move(msg)};
    }
    static ProtocolFailure Decryption(std::string msg) {
        return {ProtocolFailureType::Decryption, std::move(msg)};
    }
    static ProtocolFailure Transport(std::string msg) {
        return {ProtocolFailureType::Transport, std::move(msg)};
    }
    static ProtocolFailure Discovery(std::string msg) {
        return {ProtocolFailureType::Discovery, std::move(msg)};
    }
    static ProtocolFailure Timeout(std::string msg) {
        return {ProtocolFailureType::Timeout, std::move(msg)};
    }
    static ProtocolFailure ObjectDisposed(std::string msg) {
        return {ProtocolFailureType::ObjectDisposed, std::move(msg)};
    }
    static ProtocolFailure NullPointer(std::string msg) {
        return {ProtocolFailureType::NullPointer, std::move(msg)};
    }
    static ProtocolFailure FromSodiumFailure(const SodiumFailure& sf) {
        return Generic(sf.message);
    }
};

[[nodiscard]] constexpr std::string_view ToString(const ProtocolFailureType type) noexcept {
    switch (type) {
        case ProtocolFailureType::Generic: return "Generic";
        case ProtocolFailureType::InvalidInput: return "InvalidInput";
        case ProtocolFailureType::InvalidState: return "InvalidState";
        case ProtocolFailureType::Encode: return "Encode";
        case ProtocolFailureType::Decode: return "Decode";
        case ProtocolFailureType::Handshake: return "Handshake";
        case ProtocolFailureType::KeyGeneration: return "KeyGeneration";
        case ProtocolFailureType::Encryption: return "Encryption";
        case ProtocolFailureType::Decryption: return "Decryption";
        case ProtocolFailureType::Transport: return "Transport";
        case ProtocolFailureType::Discovery: return "Discovery";
        case ProtocolFailureType::Timeout: return "Timeout";
        case ProtocolFailureType::ObjectDisposed: return "ObjectDisposed";
        case ProtocolFailureType::NullPointer: return "NullPointer";
    }
    return "Unknown";
}
}
