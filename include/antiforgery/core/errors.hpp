/**
 *
 *  @file errors.hpp
 *  @author Gaspard Kirira
 *
 *  Copyright 2025, Gaspard Kirira.  All rights reserved.
 *  https://github.com/vixcpp/vix
 *  Use of this source code is governed by a MIT license
 *  that can be found in the License file.
 *
 *  Vix.cpp
 */
#ifndef ANTIFORGERY_CORE_ERRORS_HPP
#define ANTIFORGERY_CORE_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <utility>

namespace antiforgery
{
  /**
   * @brief Operator misconfiguration.
   *
   * Raised when the running configuration cannot be honored for the current
   * exchange (for example require_ssl on a plain HTTP request). Carries the
   * name of the offending setting.
   */
  class ConfigurationError : public std::logic_error
  {
  public:
    ConfigurationError(std::string setting, const std::string &message)
        : std::logic_error(message), setting_(std::move(setting))
    {
    }

    const std::string &setting() const noexcept { return setting_; }

  private:
    std::string setting_;
  };

  /**
   * @brief A serialized token could not be parsed or authenticated.
   *
   * Kept apart from validation failures so callers can tell
   * "could not parse" from "parsed but invalid".
   */
  class MalformedTokenError : public std::runtime_error
  {
  public:
    explicit MalformedTokenError(const std::string &reason)
        : std::runtime_error("The antiforgery token could not be deserialized: " + reason)
    {
    }
  };

} // namespace antiforgery

#endif // ANTIFORGERY_CORE_ERRORS_HPP
