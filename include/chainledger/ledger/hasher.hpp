#pragma once

#include <datapod/datapod.hpp>
#include <optional>
#include <string>
#include <vector>

#include "canonical.hpp"

namespace chainledger::ledger {

    /// Sentinel stored as prev_hash of the first record in a scope
    inline const std::string EMPTY_PREV_HASH = "";

    /// Pure function from (fields, prev_hash) to a lowercase hex SHA-256 digest.
    ///
    /// The canonical input is `fields` with a "prev_hash" member added (an absent
    /// prev_hash is written as the empty string), serialized by CanonicalObject.
    /// Any other implementation that follows the same rules computes the same digest.
    class CanonicalHasher {
      public:
        static dp::Result<std::string, dp::Error> hash(const CanonicalObject &fields,
                                                       const std::optional<std::string> &prev_hash);

        /// The exact text that gets hashed
        static dp::Result<std::string, dp::Error> canonicalize(const CanonicalObject &fields,
                                                               const std::optional<std::string> &prev_hash);

        static dp::Result<std::string, dp::Error> sha256Hex(const std::string &data);

        /// 64 lowercase hex characters
        static bool isDigest(const std::string &text);
    };

} // namespace chainledger::ledger
