#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace cw {

using Url = std::string;

// One history entry.
struct LoadData {
  Url url;
  std::string method{"GET"};
  std::optional<Url> referrerUrl;
};

// Network error codes, Chromium numbering (all negative).
enum class NetError : std::int32_t {
  IoPending                = -1,
  Failed                   = -2,
  Aborted                  = -3,
  InvalidArgument          = -4,
  FileNotFound             = -6,
  TimedOut                 = -7,
  FileTooBig               = -8,
  AccessDenied             = -10,
  NotImplemented           = -11,
  InsufficientResources    = -12,
  OutOfMemory              = -13,
  ConnectionClosed         = -100,
  ConnectionReset          = -101,
  ConnectionRefused        = -102,
  ConnectionAborted        = -103,
  ConnectionFailed         = -104,
  NameNotResolved          = -105,
  InternetDisconnected     = -106,
  SslProtocolError         = -107,
  AddressInvalid           = -108,
  AddressUnreachable       = -109,
  ConnectionTimedOut       = -118,
  CertCommonNameInvalid    = -200,
  CertDateInvalid          = -201,
  CertAuthorityInvalid     = -202,
  CertRevoked              = -206,
  InvalidUrl               = -300,
  DisallowedUrlScheme      = -301,
  UnknownUrlScheme         = -302,
  TooManyRedirects         = -310,
  UnsafeRedirect           = -311,
  EmptyResponse            = -324,
  InvalidHttpResponse      = -370
};

const char* netErrorName(NetError e);

} // namespace cw
