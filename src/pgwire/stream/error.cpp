/* Flow-PG: Stream
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

/// @file
#include "pgwire/stream/error.hpp"
#include "pgwire/util/util_fwd.hpp"

namespace pgwire::stream::error
{

// Types.

/**
 * The boost.system category for errors returned by the pgwire::stream module.  Think of it as the polymorphic
 * counterpart of error::Code, and it kicks in when, for `Error_code ec`, something
 * like `ec.message()` is invoked.
 *
 * Note that this class's declaration is not available outside this translation unit (.cpp
 * file), and its logic is accessed indirectly through standard boost.system machinery
 * (`Error_code::name()` and `Error_code::message()`).
 */
class Category :
  public boost::system::error_category
{
public:
  // Constants.

  /// The one Category.
  static const Category S_CATEGORY;

  // Methods.

  /**
   * Implements super-class API: returns a `static` string representing this `error_category` (which,
   * for example, shows up in the `ostream` representation of any Category-belonging
   * #Error_code).
   *
   * @return A `static` string that's a brief description of this error category.
   */
  const char* name() const noexcept override;

  /**
   * Implements super-class API: given the integer error code of an error in this category, returns a description of
   * that error (similarly in spirit to `std::strerror()`).
   *
   * @param val
   *        Error code of an Category error (realistically, a #Code `enum` value cast to
   *        `int`).
   * @return String describing the error.
   */
  std::string message(int val) const override;

  /**
   * The guts of the `ostream << Code` operation: outputs, e.g., Code::S_NOT_CONNECTED => `"NOT_CONNECTED"`.
   * @param code
   *        A Code.
   * @return What would/should be printed to an `ostream` given `code`.
   */
  static util::String_view code_symbol(Code code);

private:
  // Constructors.

  /// Boring constructor.
  explicit Category();
}; // class Category

// Static initializations.

const Category Category::S_CATEGORY;

// Implementations.

Error_code make_error_code(Code err_code)
{
  // Glues together Category::name()/message() with the Code enum.
  return Error_code(static_cast<int>(err_code), Category::S_CATEGORY);
}

Category::Category() = default;

const char* Category::name() const noexcept // Virtual.
{
  return "pgwire/stream";
}

std::string Category::message(int val) const // Virtual.
{
  // KEEP THESE STRINGS IN SYNC WITH COMMENT IN error.hpp ON THE INDIVIDUAL ENUM MEMBERS!

  switch (static_cast<Code>(val))
  {
  case Code::S_NOT_CONNECTED:
    return "Cannot send request: the connection to the backend is not open.";
  case Code::S_PIPELINING_NOT_ENABLED:
    return "Cannot send request: a reply is already pending, and pipelining is not enabled for this stream.";
  case Code::S_SECURITY_NOT_SUPPORTED_BY_BACKEND:
    return "Security (TLS) requested but not supported by backend server.";
  case Code::S_CHANNEL_INACTIVE:
    return "Channel state changed to inactive: the connection closed before the reply completed.";
  case Code::S_NO_SUCH_SUBSCRIBER:
    return "Unsubscribe failed: no subscriber with the given token on the given notification channel.";
  case Code::S_TLS_TRUST_POLICY_UNSPECIFIED:
    return "TLS is enabled, but no certificate trust policy was configured; refusing to connect.";
  case Code::S_TLS_PINNED_CERTIFICATE_MISMATCH:
    return "TLS peer certificate does not match the pinned certificate.";
  case Code::S_TLS_PINNED_CERTIFICATE_UNREADABLE:
    return "The configured pinned certificate could not be loaded.";
  case Code::S_INVALID_ARGUMENT:
    return "User called an API with 1 or more arguments violating the documented API contract.";
  case Code::S_OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER:
    return "Async completion handler is being called prematurely, because underlying object is shutting down, "
           "as user desires.";

  case Code::S_END_SENTINEL:
    assert(false && "SENTINEL: Not an error.  "
                    "This Code must never be issued by an error/success-emitting API; I/O use only.");
  }
  assert(false);
  return "";
} // Category::message()

util::String_view Category::code_symbol(Code code) // Static.
{
  // Note: Must satisfy istream_to_enum() requirements.

  switch (code)
  {
  case Code::S_NOT_CONNECTED:
    return "NOT_CONNECTED";
  case Code::S_PIPELINING_NOT_ENABLED:
    return "PIPELINING_NOT_ENABLED";
  case Code::S_SECURITY_NOT_SUPPORTED_BY_BACKEND:
    return "SECURITY_NOT_SUPPORTED_BY_BACKEND";
  case Code::S_CHANNEL_INACTIVE:
    return "CHANNEL_INACTIVE";
  case Code::S_NO_SUCH_SUBSCRIBER:
    return "NO_SUCH_SUBSCRIBER";
  case Code::S_TLS_TRUST_POLICY_UNSPECIFIED:
    return "TLS_TRUST_POLICY_UNSPECIFIED";
  case Code::S_TLS_PINNED_CERTIFICATE_MISMATCH:
    return "TLS_PINNED_CERTIFICATE_MISMATCH";
  case Code::S_TLS_PINNED_CERTIFICATE_UNREADABLE:
    return "TLS_PINNED_CERTIFICATE_UNREADABLE";
  case Code::S_INVALID_ARGUMENT:
    return "INVALID_ARGUMENT";
  case Code::S_OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER:
    return "OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER";

  case Code::S_END_SENTINEL:
    return "END_SENTINEL";
  }
  assert(false);
  return "";
}

std::ostream& operator<<(std::ostream& os, Code val)
{
  // Note: Must satisfy istream_to_enum() requirements.
  return os << Category::code_symbol(val);
}

std::istream& operator>>(std::istream& is, Code& val)
{
  /* Range [<1st Code>, END_SENTINEL); no match => END_SENTINEL;
   * allow for number instead of ostream<< string; case-insensitive. */
  val = flow::util::istream_to_enum(&is, Code::S_END_SENTINEL, Code::S_END_SENTINEL, true, false,
                                    Code(S_CODE_LOWEST_INT_VALUE));
  return is;
}

} // namespace pgwire::stream::error
