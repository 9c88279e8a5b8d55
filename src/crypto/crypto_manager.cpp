/**
 * CryptoManager — libsodium operations used by the channel.
 *
 * - secretbox encryption of message envelopes
 * - random tokens for liveness probes and transfer ids
 */

#include "crypto/crypto_manager.h"

#include <sodium.h>

#include <stdexcept>
#include <utility>

namespace {

const char kDefaultKey[] = "my 32 length key................";
const char kDefaultNonce[] = "my 24 length nonce......";

std::vector<uint8_t> to_bytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

} // namespace

ChannelKey ChannelKey::defaults() {
    return from_strings(kDefaultKey, kDefaultNonce);
}

ChannelKey ChannelKey::from_strings(const std::string& key, const std::string& nonce) {
    if (key.size() != crypto_secretbox_KEYBYTES) {
        throw std::invalid_argument("channel key must be " +
                                    std::to_string(crypto_secretbox_KEYBYTES) + " bytes");
    }
    if (nonce.size() != crypto_secretbox_NONCEBYTES) {
        throw std::invalid_argument("channel nonce must be " +
                                    std::to_string(crypto_secretbox_NONCEBYTES) + " bytes");
    }
    return ChannelKey{to_bytes(key), to_bytes(nonce)};
}

bool ChannelKey::valid() const {
    return key.size() == crypto_secretbox_KEYBYTES &&
           nonce.size() == crypto_secretbox_NONCEBYTES;
}

CryptoManager::CryptoManager(ChannelKey key) : key_(std::move(key)) {
    if (!key_.valid()) {
        throw std::invalid_argument("invalid channel key material");
    }
}

bool CryptoManager::init() {
    // sodium_init returns 1 when already initialised
    return sodium_init() >= 0;
}

std::string CryptoManager::random_hex(std::size_t count) {
    std::vector<unsigned char> raw(count);
    randombytes_buf(raw.data(), raw.size());

    std::string hex(count * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), raw.data(), raw.size());
    hex.pop_back();
    return hex;
}

std::string CryptoManager::encrypt(const std::string& plaintext) const {
    std::string out(crypto_secretbox_MACBYTES + plaintext.size(), '\0');
    crypto_secretbox_easy(reinterpret_cast<unsigned char*>(out.data()),
                          reinterpret_cast<const unsigned char*>(plaintext.data()),
                          plaintext.size(),
                          key_.nonce.data(),
                          key_.key.data());
    return out;
}

bool CryptoManager::decrypt(const std::string& ciphertext, std::string& plaintext) const {
    if (ciphertext.size() < crypto_secretbox_MACBYTES) {
        return false;
    }

    std::string out(ciphertext.size() - crypto_secretbox_MACBYTES, '\0');
    if (crypto_secretbox_open_easy(reinterpret_cast<unsigned char*>(out.data()),
                                   reinterpret_cast<const unsigned char*>(ciphertext.data()),
                                   ciphertext.size(),
                                   key_.nonce.data(),
                                   key_.key.data()) != 0) {
        return false;
    }
    plaintext = std::move(out);
    return true;
}
