#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace storage
{

inline constexpr std::size_t DIGEST_SIZE      = 32;  // crypto_generichash_BYTES
inline constexpr int         MAX_NAME_RETRIES = 1000;

struct StoreResult
{
    bool        ok = false;
    std::string path;    // final location when ok
    std::string detail;  // failure reason when !ok
};

// Storage capability the receiver hands completed files to.
class IFileStore
{
  public:
    virtual ~IFileStore() = default;

    // Create a NEW file from bytes. Never overwrites an existing file.
    virtual StoreResult write_new(const std::string               &name,
                                  const std::vector<std::uint8_t> &bytes) = 0;
};

class DirectoryStore final : public IFileStore
{
  public:
    explicit DirectoryStore(std::string dir) : dir_(std::move(dir)) {}

    StoreResult write_new(const std::string               &name,
                          const std::vector<std::uint8_t> &bytes) override;

    const std::string &dir() const { return dir_; }

  private:
    std::string dir_;
};

// BLAKE2b-256 of bytes as lowercase hex; empty string if libsodium is unusable.
std::string digest_hex(const std::vector<std::uint8_t> &bytes);

// "a.pdf", 2 -> "a-2.pdf"; names without an extension get the suffix appended.
std::string numbered_name(const std::string &name, int n);

}  // namespace storage
