#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

/**
 * Symmetric key material shared by both ends of a channel.
 *
 * The defaults are fixed constants compiled into every build, so they give
 * no confidentiality between unrelated sessions. Supply a real key through
 * ChannelConfig::key when the pairing step can provide one.
 */
struct ChannelKey {
    std::vector<uint8_t> key;    // crypto_secretbox_KEYBYTES
    std::vector<uint8_t> nonce;  // crypto_secretbox_NONCEBYTES

    static ChannelKey defaults();

    /// Build from raw strings; throws std::invalid_argument on wrong sizes.
    static ChannelKey from_strings(const std::string& key, const std::string& nonce);

    [[nodiscard]] bool valid() const;
};

/**
 * Wraps libsodium for the channel's symmetric encryption and random tokens.
 *
 * Encryption: XSalsa20-Poly1305 (crypto_secretbox_easy)
 */
class CryptoManager {
public:
    explicit CryptoManager(ChannelKey key = ChannelKey::defaults());

    /// Must be called once before any other method.
    static bool init();

    /// `count` random bytes, hex encoded.
    static std::string random_hex(std::size_t count);

    /// Encrypt with the channel key. Output is MAC + ciphertext.
    std::string encrypt(const std::string& plaintext) const;

    /// Decrypt with the channel key. Returns false on authentication failure,
    /// leaving `plaintext` untouched.
    bool decrypt(const std::string& ciphertext, std::string& plaintext) const;

private:
    ChannelKey key_;
};
