#pragma once

#include <string>
#include <utility>

#include <datapod/datapod.hpp>
#include <datapod/pods/adapters/result.hpp>

namespace flotilla {

    enum class ErrorKind : dp::u8 {
        InvalidSerial = 1,
        DuplicateSerial = 2,
        NotFound = 3,
        InvalidMovement = 4,
        NoUnits = 5,
        Io = 6,
    };

    inline const char *to_string(ErrorKind kind) {
        switch (kind) {
        case ErrorKind::InvalidSerial:
            return "invalid serial";
        case ErrorKind::DuplicateSerial:
            return "duplicate serial";
        case ErrorKind::NotFound:
            return "not found";
        case ErrorKind::InvalidMovement:
            return "invalid movement";
        case ErrorKind::NoUnits:
            return "no units";
        case ErrorKind::Io:
            return "io";
        }
        return "unknown";
    }

    /// Error carried by every fallible flotilla operation.
    ///
    /// `kind` is what callers branch on; `message` is for humans and logs.
    struct Error {
        ErrorKind kind = ErrorKind::NotFound;
        std::string message;

        static Error invalid_serial(std::string msg) { return Error{ErrorKind::InvalidSerial, std::move(msg)}; }
        static Error duplicate_serial(std::string msg) { return Error{ErrorKind::DuplicateSerial, std::move(msg)}; }
        static Error not_found(std::string msg) { return Error{ErrorKind::NotFound, std::move(msg)}; }
        static Error invalid_movement(std::string msg) { return Error{ErrorKind::InvalidMovement, std::move(msg)}; }
        static Error no_units(std::string msg) { return Error{ErrorKind::NoUnits, std::move(msg)}; }
        static Error io(std::string msg) { return Error{ErrorKind::Io, std::move(msg)}; }
    };

    template <typename T> using Result = dp::Result<T, Error>;

} // namespace flotilla
