#include <chainledger/common/error.hpp>
#include <chainledger/ledger/hasher.hpp>
#include <keylock/keylock.hpp>

#include <algorithm>
#include <cctype>

namespace chainledger::ledger {

    dp::Result<std::string, dp::Error> CanonicalHasher::canonicalize(const CanonicalObject &fields,
                                                                     const std::optional<std::string> &prev_hash) {
        CanonicalObject input = fields;
        input.setString("prev_hash", prev_hash.value_or(EMPTY_PREV_HASH));
        return input.serialize();
    }

    dp::Result<std::string, dp::Error> CanonicalHasher::hash(const CanonicalObject &fields,
                                                             const std::optional<std::string> &prev_hash) {
        auto canonical = canonicalize(fields, prev_hash);
        if (!canonical.is_ok())
            return canonical;
        return sha256Hex(canonical.value());
    }

    dp::Result<std::string, dp::Error> CanonicalHasher::sha256Hex(const std::string &data) {
        keylock::keylock crypto(keylock::Algorithm::XChaCha20_Poly1305, keylock::HashAlgorithm::SHA256);
        std::vector<uint8_t> data_vec(data.begin(), data.end());
        auto hash_result = crypto.hash(data_vec);
        if (!hash_result.success)
            return dp::Result<std::string, dp::Error>::err(hash_failed("SHA-256 failed: " + hash_result.error_message));

        std::string hex = keylock::keylock::to_hex(hash_result.data);
        std::transform(hex.begin(), hex.end(), hex.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return dp::Result<std::string, dp::Error>::ok(hex);
    }

    bool CanonicalHasher::isDigest(const std::string &text) {
        if (text.size() != 64)
            return false;
        return std::all_of(text.begin(), text.end(),
                           [](char c) { return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'); });
    }

} // namespace chainledger::ledger
