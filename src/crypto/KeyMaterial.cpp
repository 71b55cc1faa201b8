#include "buffervault/crypto/KeyMaterial.hpp"
#include <fstream>
#include <ios>
#include <span>
#include <stdexcept>
#include <system_error>

namespace buffervault::crypto
{
namespace
{

[[nodiscard]] Salt readSaltFile(const std::filesystem::path& path)
{
    std::error_code ec{};
    const auto size{ std::filesystem::file_size(path, ec) };
    if (ec)
    {
        throw std::runtime_error("salt: failed to stat salt file");
    }
    if (size != g_kSaltBytes)
    {
        throw std::runtime_error("salt: salt file has unexpected size");
    }

    std::ifstream in{ path, std::ios::binary };
    if (!in)
    {
        throw std::runtime_error("salt: failed to open salt file for reading");
    }

    Salt salt{};
    in.read(reinterpret_cast<char*>(salt.data()), static_cast<std::streamsize>(salt.size()));
    if (!in)
    {
        throw std::runtime_error("salt: failed to read salt file");
    }
    return salt;
}

void writeSaltFile(const std::filesystem::path& path, const Salt& salt)
{
    std::ofstream out{ path, std::ios::binary | std::ios::trunc };
    if (!out)
    {
        throw std::runtime_error("salt: failed to open salt file for writing");
    }

    out.write(reinterpret_cast<const char*>(salt.data()), static_cast<std::streamsize>(salt.size()));
    out.flush();
    if (!out)
    {
        throw std::runtime_error("salt: failed to write salt file");
    }
}

} // namespace

Salt loadOrCreateSalt(ICryptoProvider& crypto, const std::filesystem::path& saltFile)
{
    std::error_code ec{};
    if (std::filesystem::exists(saltFile, ec))
    {
        return readSaltFile(saltFile);
    }
    if (ec)
    {
        throw std::runtime_error("salt: failed to probe salt file");
    }

    if (saltFile.has_parent_path())
    {
        std::filesystem::create_directories(saltFile.parent_path(), ec);
        if (ec)
        {
            throw std::runtime_error("salt: failed to create vault directory");
        }
    }

    Salt salt{};
    if (!crypto.randomBytes(std::span<std::uint8_t>{ salt }))
    {
        throw std::runtime_error("salt: CSPRNG failure");
    }
    writeSaltFile(saltFile, salt);
    return salt;
}

} // namespace buffervault::crypto
