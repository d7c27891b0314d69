#pragma once

#include <cstddef>
#include <string>
#include <utility>

#include "flotilla/error.hpp"

namespace flotilla {

    /// Validated unit serial number.
    ///
    /// Format is `DDDDDDDD-DD`: eight ASCII digits, a hyphen, two ASCII digits.
    /// The only way to obtain a Serial is `Serial::parse`, so holding one means the
    /// value already passed validation.
    class Serial {
      public:
        static constexpr std::size_t kLength = 11;
        static constexpr std::size_t kHyphenAt = 8;

        // All-zero serial; keeps default construction inside the valid format.
        Serial() : value_("00000000-00") {}

        static bool is_valid(const std::string &value) {
            if (value.size() != kLength) {
                return false;
            }
            for (std::size_t i = 0; i < value.size(); ++i) {
                const char c = value[i];
                if (i == kHyphenAt) {
                    if (c != '-') {
                        return false;
                    }
                } else if (c < '0' || c > '9') {
                    return false;
                }
            }
            return true;
        }

        static Result<Serial> parse(const std::string &value) {
            if (!is_valid(value)) {
                return Result<Serial>::err(
                    Error::invalid_serial("serial '" + value + "' must be in the format DDDDDDDD-DD"));
            }
            return Result<Serial>::ok(Serial(value));
        }

        const std::string &str() const { return value_; }

        bool operator==(const Serial &other) const { return value_ == other.value_; }
        bool operator!=(const Serial &other) const { return value_ != other.value_; }

      private:
        explicit Serial(std::string value) : value_(std::move(value)) {}

        std::string value_;
    };

} // namespace flotilla
