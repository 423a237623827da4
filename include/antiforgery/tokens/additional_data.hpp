#ifndef ANTIFORGERY_TOKENS_ADDITIONAL_DATA_HPP
#define ANTIFORGERY_TOKENS_ADDITIONAL_DATA_HPP

#include <string>
#include <string_view>

#include <antiforgery/middleware.hpp>

namespace antiforgery::tokens
{
  /**
   * @brief Extra application data carried in every request token.
   *
   * Lets an application tie a request token to something beyond the caller
   * identity (a tenant, a form purpose, a nonce it tracks itself).
   */
  class IAdditionalDataProvider
  {
  public:
    virtual ~IAdditionalDataProvider() = default;

    /** @brief Data embedded into a request token at issuance. */
    virtual std::string get_additional_data(const Context &ctx) const = 0;

    /** @brief Accept or reject the data found in a submitted request token. */
    virtual bool validate_additional_data(const Context &ctx, std::string_view data) const = 0;
  };

} // namespace antiforgery::tokens

#endif // ANTIFORGERY_TOKENS_ADDITIONAL_DATA_HPP
