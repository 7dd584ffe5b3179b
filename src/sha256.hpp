// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace netward {

/**
 * Incremental SHA-256 (FIPS 180-4).
 */
class Sha256 {
  public:
    using Digest = std::array<uint8_t, 32>;

    Sha256();

    void update(const uint8_t* data, size_t len);
    void update(const std::string& data) { update(reinterpret_cast<const uint8_t*>(data.data()), data.size()); }
    Digest finish();

    static Digest hash(const std::string& data);
    static std::string hash_hex(const std::string& data);
    static std::string to_hex(const Digest& digest);

  private:
    void transform(const uint8_t* block);

    std::array<uint32_t, 8> state_{};
    std::array<uint8_t, 64> buffer_{};
    size_t buffer_len_ = 0;
    uint64_t total_len_ = 0;
};

bool sha256_file_hex(const std::string& path, std::string& out_hex);

} // namespace netward
