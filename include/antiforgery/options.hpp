/**
 *
 *  @file options.hpp
 *  @author Gaspard Kirira
 *
 *  Copyright 2025, Gaspard Kirira.  All rights reserved.
 *  https://github.com/vixcpp/vix
 *  Use of this source code is governed by a MIT license
 *  that can be found in the License file.
 *
 *  Vix.cpp
 */
#ifndef ANTIFORGERY_OPTIONS_HPP
#define ANTIFORGERY_OPTIONS_HPP

#include <functional>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include <antiforgery/middleware.hpp>

namespace antiforgery
{
  /**
   * @brief Antiforgery configuration.
   *
   * Passed by value at construction and never mutated afterwards.
   */
  struct AntiforgeryOptions
  {
    /** @brief Name of the cookie holding the cookie token. */
    std::string cookie_name{".Vix.Antiforgery"};

    std::string cookie_path{"/"};

    /** @brief Domain attribute of the cookie. Empty means host-only. */
    std::string cookie_domain{};

    /** @brief Form field carrying the request token. */
    std::string form_field_name{"__RequestVerificationToken"};

    /**
     * @brief Header carrying the request token.
     *
     * std::nullopt disables header based submission; only the form field
     * is then accepted.
     */
    std::optional<std::string> header_name{"RequestVerificationToken"};

    /**
     * @brief Refuse to run on non HTTPS exchanges.
     *
     * Also marks the cookie Secure.
     */
    bool require_ssl{false};

    /** @brief Do not emit "X-Frame-Options: SAMEORIGIN" when tokens are stored. */
    bool suppress_x_frame_options_header{false};

    /** @brief Bind request tokens to the authenticated identity. */
    bool identity_binding{true};

    /**
     * @brief Accept authenticated identities that carry neither a name nor
     * an identifying claim.
     *
     * When false such an identity is a configuration error at issuance.
     */
    bool suppress_identity_heuristic_checks{false};

    /**
     * @brief Transport security probe.
     *
     * Empty means http::is_https (forwarded proto headers).
     */
    std::function<bool(const Request &)> is_secure{};
  };

  /**
   * @brief Reject option values the protocol cannot work with.
   *
   * @throws ConfigurationError naming the offending option.
   */
  void validate_options(const AntiforgeryOptions &opt);

  /**
   * @brief Build options from a JSON object.
   *
   * Keys match the field names of AntiforgeryOptions. Missing keys keep their
   * defaults, unknown keys are ignored, "header_name": null disables the
   * header. The result is validated.
   *
   * @throws ConfigurationError on a wrongly typed key or invalid value.
   */
  AntiforgeryOptions options_from_json(const nlohmann::json &j);

} // namespace antiforgery

#endif // ANTIFORGERY_OPTIONS_HPP
