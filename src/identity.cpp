#include <antiforgery/tokens/identity.hpp>

#include <openssl/evp.h>

#include <algorithm>
#include <cstdint>
#include <memory>
#include <stdexcept>

namespace antiforgery::tokens
{
  namespace
  {
    struct MdCtxDeleter
    {
      void operator()(EVP_MD_CTX *p) const noexcept { EVP_MD_CTX_free(p); }
    };

    using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

    void update_with_field(EVP_MD_CTX *md, const std::string &s)
    {
      const std::uint32_t n = static_cast<std::uint32_t>(s.size());
      const unsigned char len[4] = {
          static_cast<unsigned char>((n >> 24) & 0xFF),
          static_cast<unsigned char>((n >> 16) & 0xFF),
          static_cast<unsigned char>((n >> 8) & 0xFF),
          static_cast<unsigned char>(n & 0xFF)};

      if (EVP_DigestUpdate(md, len, sizeof(len)) != 1 ||
          EVP_DigestUpdate(md, s.data(), s.size()) != 1)
        throw std::runtime_error("SHA-256 update failed while hashing claims");
    }

    std::vector<Claim> identifying_claims(const Identity &identity)
    {
      for (const char *preferred : {"sub", "nameidentifier", "upn"})
      {
        auto it = std::find_if(identity.claims.begin(), identity.claims.end(),
                               [preferred](const Claim &c)
                               { return c.type == preferred && !c.value.empty(); });
        if (it != identity.claims.end())
          return {*it};
      }

      std::vector<Claim> all = identity.claims;
      std::sort(all.begin(), all.end(), [](const Claim &a, const Claim &b)
                {
                  if (a.type != b.type)
                    return a.type < b.type;
                  return a.value < b.value; });
      return all;
    }
  } // namespace

  const Identity *current_identity(const Context &ctx) noexcept
  {
    const Identity *id = ctx.try_state<Identity>();
    if (!id || !id->authenticated)
      return nullptr;
    return id;
  }

  std::optional<BinaryBlob> extract_claim_uid(const Identity &identity)
  {
    if (identity.claims.empty())
      return std::nullopt;

    const std::vector<Claim> claims = identifying_claims(identity);

    MdCtxPtr md(EVP_MD_CTX_new());
    if (!md || EVP_DigestInit_ex(md.get(), EVP_sha256(), nullptr) != 1)
      throw std::runtime_error("SHA-256 init failed while hashing claims");

    for (const auto &c : claims)
    {
      update_with_field(md.get(), c.type);
      update_with_field(md.get(), c.value);
    }

    std::vector<std::uint8_t> digest(EVP_MAX_MD_SIZE);
    unsigned int out_len = 0;
    if (EVP_DigestFinal_ex(md.get(), digest.data(), &out_len) != 1)
      throw std::runtime_error("SHA-256 final failed while hashing claims");

    digest.resize(out_len);
    return BinaryBlob(std::move(digest));
  }

} // namespace antiforgery::tokens
