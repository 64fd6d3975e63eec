/**
 * @file ContentHasher.cpp
 * @brief Implementation of ContentHasher.
 */

#include "infrastructure/ContentHasher.hpp"
#include "domain/PipelineErrors.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <fstream>
#include <memory>

namespace loopbinder::infrastructure {

namespace fs = std::filesystem;

namespace {

class Sha256 {
public:
    Sha256() : m_ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free) {
        if (!m_ctx || EVP_DigestInit_ex(m_ctx.get(), EVP_sha256(), nullptr) != 1) {
            throw domain::IoError("OpenSSL: EVP sha256 init failed");
        }
    }

    void update(const void* data, std::size_t len) {
        if (len == 0) return;
        if (EVP_DigestUpdate(m_ctx.get(), data, len) != 1) {
            throw domain::IoError("OpenSSL: EVP sha256 update failed");
        }
    }

    // Little-endian length prefix.
    void updateLength(std::uint64_t value) {
        std::array<unsigned char, 8> bytes{};
        for (std::size_t i = 0; i < bytes.size(); ++i) bytes[i] = static_cast<unsigned char>(value >> (8 * i));
        update(bytes.data(), bytes.size());
    }

    void updateFile(const fs::path& file) {
        std::ifstream in(file, std::ios::binary);
        if (!in) throw domain::IoError("cannot read " + file.string());
        std::array<char, 8192> buffer{};
        while (in) {
            in.read(buffer.data(), buffer.size());
            std::streamsize read = in.gcount();
            if (read > 0) update(buffer.data(), static_cast<std::size_t>(read));
        }
        if (in.bad()) throw domain::IoError("read error on " + file.string());
    }

    std::string hex() {
        std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
        unsigned int outLen = 0;
        if (EVP_DigestFinal_ex(m_ctx.get(), digest.data(), &outLen) != 1) {
            throw domain::IoError("OpenSSL: EVP sha256 final failed");
        }
        static const char* kHex = "0123456789abcdef";
        std::string out;
        out.reserve(outLen * 2);
        for (unsigned int i = 0; i < outLen; ++i) {
            out.push_back(kHex[digest[i] >> 4]);
            out.push_back(kHex[digest[i] & 0x0F]);
        }
        return out;
    }

private:
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> m_ctx;
};

} // namespace

std::string ContentHasher::digest(std::string_view data) const {
    Sha256 sha;
    sha.update(data.data(), data.size());
    return sha.hex();
}

std::string ContentHasher::fileDigest(const fs::path& file) const {
    Sha256 sha;
    sha.updateFile(file);
    return sha.hex();
}

std::string ContentHasher::setDigest(std::vector<fs::path> files) const {
    std::sort(files.begin(), files.end(), [](const fs::path& a, const fs::path& b) {
        return a.filename().string() < b.filename().string();
    });

    Sha256 sha;
    sha.updateLength(files.size());
    for (const auto& file : files) {
        const std::string name = file.filename().string();
        std::error_code ec;
        const auto size = fs::file_size(file, ec);
        if (ec) throw domain::IoError("cannot stat " + file.string() + ": " + ec.message());

        sha.updateLength(name.size());
        sha.update(name.data(), name.size());
        sha.updateLength(size);
        sha.updateFile(file);
    }
    return sha.hex();
}

} // namespace loopbinder::infrastructure
