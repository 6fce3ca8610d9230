#pragma once

#include <string>
#include <vector>
#include <fstream>
#include <openssl/evp.h>
#include <sstream>
#include <iomanip>
#include <stdexcept>

namespace parafetch::utils {

/**
 * @brief Incremental SHA-256 over OpenSSL EVP
 */
class Sha256 {
public:
    Sha256() : m_ctx(EVP_MD_CTX_new()) {
        if (!m_ctx) {
            throw std::runtime_error("Failed to create digest context");
        }
        if (EVP_DigestInit_ex(m_ctx, EVP_sha256(), nullptr) != 1) {
            EVP_MD_CTX_free(m_ctx);
            throw std::runtime_error("Failed to initialize SHA-256");
        }
    }

    ~Sha256() {
        EVP_MD_CTX_free(m_ctx);
    }

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    void update(const char* data, size_t size) {
        if (m_finished) {
            throw std::logic_error("SHA-256 already finalized");
        }
        if (size > 0 && EVP_DigestUpdate(m_ctx, data, size) != 1) {
            throw std::runtime_error("SHA-256 update failed");
        }
    }

    // Lower-case hex digest. The accumulator cannot be updated afterwards.
    std::string finalHex() {
        if (m_finished) {
            throw std::logic_error("SHA-256 already finalized");
        }

        unsigned char hash[EVP_MAX_MD_SIZE];
        unsigned int hashLen = 0;
        if (EVP_DigestFinal_ex(m_ctx, hash, &hashLen) != 1) {
            throw std::runtime_error("SHA-256 finalization failed");
        }
        m_finished = true;

        std::ostringstream oss;
        for (unsigned int i = 0; i < hashLen; ++i) {
            oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(hash[i]);
        }
        return oss.str();
    }

private:
    EVP_MD_CTX* m_ctx;
    bool m_finished{false};
};

class HashUtils {
public:
    static constexpr size_t kDefaultBlockSize = 1024 * 1024;

    /**
     * Hash a file in fixed-size blocks; the file is never held in memory.
     * @return Lower-case hex digest, or an empty string if the file cannot be read
     */
    static std::string sha256File(const std::string& filePath, size_t blockSize = kDefaultBlockSize) {
        std::ifstream file(filePath, std::ios::binary);
        if (!file.is_open()) return "";

        Sha256 digest;
        std::vector<char> buffer(blockSize > 0 ? blockSize : kDefaultBlockSize);
        while (file.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || file.gcount() > 0) {
            digest.update(buffer.data(), static_cast<size_t>(file.gcount()));
        }
        if (file.bad()) return "";

        return digest.finalHex();
    }

    static std::string sha256String(const std::string& data) {
        Sha256 digest;
        digest.update(data.data(), data.size());
        return digest.finalHex();
    }
};

} // namespace parafetch::utils
