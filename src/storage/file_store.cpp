#include <array>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <sodium.h>
#include <string>
#include <unistd.h>

#include "storage/file_store.hpp"
#include "util/log.hpp"

namespace storage
{
namespace fs = std::filesystem;

static_assert(DIGEST_SIZE == crypto_generichash_BYTES, "digest size mismatch");

static bool ensure_sodium_init()
{
    static int ok = (sodium_init() >= 0);  // -1 means failed
    return ok;
}

std::string digest_hex(const std::vector<std::uint8_t> &bytes)
{
    if (!ensure_sodium_init())
        return {};
    std::array<unsigned char, DIGEST_SIZE> h{};
    if (crypto_generichash(h.data(), h.size(), bytes.empty() ? nullptr : bytes.data(),
                           bytes.size(), nullptr, 0) != 0)
        return {};
    char hex[DIGEST_SIZE * 2 + 1];
    sodium_bin2hex(hex, sizeof(hex), h.data(), h.size());
    return std::string(hex);
}

std::string numbered_name(const std::string &name, int n)
{
    const auto dot = name.rfind('.');
    // leading dot (hidden file) is not an extension
    if (dot == std::string::npos || dot == 0)
        return name + "-" + std::to_string(n);
    return name.substr(0, dot) + "-" + std::to_string(n) + name.substr(dot);
}

static bool valid_name(const std::string &name)
{
    return !name.empty() && name != "." && name != ".." &&
           name.find('/') == std::string::npos && name.find('\0') == std::string::npos;
}

static bool ensure_dir(const std::string &dir, std::string &why)
{
    std::error_code ec;
    if (fs::is_directory(dir, ec))
        return true;
    if (!fs::create_directories(dir, ec) && ec)
    {
        why = "create_directories(" + dir + ") failed: " + ec.message();
        return false;
    }
    if (!fs::is_directory(dir, ec))
    {
        why = dir + " is not a directory";
        return false;
    }
    return true;
}

static bool write_all(int fd, const std::uint8_t *data, std::size_t len)
{
    std::size_t done = 0;
    while (done < len)
    {
        ssize_t n = ::write(fd, data + done, len - done);
        if (n > 0)
        {
            done += static_cast<std::size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR)
            continue;
        return false;
    }
    return true;
}

StoreResult DirectoryStore::write_new(const std::string               &name,
                                      const std::vector<std::uint8_t> &bytes)
{
    StoreResult res;
    if (!valid_name(name))
    {
        res.detail = "invalid file name '" + name + "'";
        LOG_ERROR("[STORE] %s", res.detail.c_str());
        return res;
    }
    if (!ensure_dir(dir_, res.detail))
    {
        LOG_ERROR("[STORE] %s", res.detail.c_str());
        return res;
    }

    // exclusive create; on collision try name-1.ext, name-2.ext, ...
    int         fd = -1;
    std::string path;
    for (int i = 0; i <= MAX_NAME_RETRIES; ++i)
    {
        path = (fs::path(dir_) / (i == 0 ? name : numbered_name(name, i))).string();
        fd   = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
        if (fd >= 0 || errno != EEXIST)
            break;
    }
    if (fd < 0)
    {
        res.detail = "open(" + path + ") failed: " + std::strerror(errno);
        LOG_ERROR("[STORE] %s", res.detail.c_str());
        return res;
    }

    const bool wrote = write_all(fd, bytes.data(), bytes.size());
    int        saved = errno;
    bool       ok    = wrote && ::fsync(fd) == 0;
    if (wrote && !ok)
        saved = errno;
    if (::close(fd) != 0 && ok)
    {
        ok    = false;
        saved = errno;
    }
    if (!ok)
    {
        res.detail = "write(" + path + ") failed: " + std::strerror(saved);
        LOG_ERROR("[STORE] %s", res.detail.c_str());
        (void)::unlink(path.c_str());  // do not leave a truncated file behind
        return res;
    }

    res.ok   = true;
    res.path = path;
    const std::string digest = digest_hex(bytes);
    LOG_SYSTEM("[STORE] saved %s (%zu bytes, blake2b=%s)", path.c_str(), bytes.size(),
               digest.empty() ? "n/a" : digest.c_str());
    return res;
}

}  // namespace storage
