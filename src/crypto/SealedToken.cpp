#include "buffervault/crypto/SealedToken.hpp"
#include <algorithm>

namespace buffervault::crypto
{

std::vector<std::uint8_t> encodeSealedToken(const AeadBox& box)
{
    std::vector<std::uint8_t> out{};
    out.reserve(g_kSealedTokenOverhead + box.cipherText.size());
    out.push_back(g_kSealedTokenVersion);
    out.insert(out.end(), box.nonce.begin(), box.nonce.end());
    out.insert(out.end(), box.cipherText.begin(), box.cipherText.end());
    out.insert(out.end(), box.tag.begin(), box.tag.end());
    return out;
}

std::optional<AeadBox> decodeSealedToken(std::span<const std::uint8_t> token)
{
    if (token.size() < g_kSealedTokenOverhead || token.front() != g_kSealedTokenVersion)
    {
        return std::nullopt;
    }

    const auto nonce{ token.subspan(1U, g_aeadNonceBytes) };
    const auto body{ token.subspan(1U + g_aeadNonceBytes, token.size() - g_kSealedTokenOverhead) };
    const auto tag{ token.last(g_aeadTagBytes) };

    AeadBox box{};
    std::ranges::copy(nonce, box.nonce.begin());
    std::ranges::copy(tag, box.tag.begin());
    box.cipherText.assign(body.begin(), body.end());
    return box;
}

} // namespace buffervault::crypto
