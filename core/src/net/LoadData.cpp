#include "cw/net/LoadData.hpp"

namespace cw {

const char* netErrorName(NetError e) {
  switch (e) {
    case NetError::IoPending: return "IO_PENDING";
    case NetError::Failed: return "FAILED";
    case NetError::Aborted: return "ABORTED";
    case NetError::InvalidArgument: return "INVALID_ARGUMENT";
    case NetError::FileNotFound: return "FILE_NOT_FOUND";
    case NetError::TimedOut: return "TIMED_OUT";
    case NetError::FileTooBig: return "FILE_TOO_BIG";
    case NetError::AccessDenied: return "ACCESS_DENIED";
    case NetError::NotImplemented: return "NOT_IMPLEMENTED";
    case NetError::InsufficientResources: return "INSUFFICIENT_RESOURCES";
    case NetError::OutOfMemory: return "OUT_OF_MEMORY";
    case NetError::ConnectionClosed: return "CONNECTION_CLOSED";
    case NetError::ConnectionReset: return "CONNECTION_RESET";
    case NetError::ConnectionRefused: return "CONNECTION_REFUSED";
    case NetError::ConnectionAborted: return "CONNECTION_ABORTED";
    case NetError::ConnectionFailed: return "CONNECTION_FAILED";
    case NetError::NameNotResolved: return "NAME_NOT_RESOLVED";
    case NetError::InternetDisconnected: return "INTERNET_DISCONNECTED";
    case NetError::SslProtocolError: return "SSL_PROTOCOL_ERROR";
    case NetError::AddressInvalid: return "ADDRESS_INVALID";
    case NetError::AddressUnreachable: return "ADDRESS_UNREACHABLE";
    case NetError::ConnectionTimedOut: return "CONNECTION_TIMED_OUT";
    case NetError::CertCommonNameInvalid: return "CERT_COMMON_NAME_INVALID";
    case NetError::CertDateInvalid: return "CERT_DATE_INVALID";
    case NetError::CertAuthorityInvalid: return "CERT_AUTHORITY_INVALID";
    case NetError::CertRevoked: return "CERT_REVOKED";
    case NetError::InvalidUrl: return "INVALID_URL";
    case NetError::DisallowedUrlScheme: return "DISALLOWED_URL_SCHEME";
    case NetError::UnknownUrlScheme: return "UNKNOWN_URL_SCHEME";
    case NetError::TooManyRedirects: return "TOO_MANY_REDIRECTS";
    case NetError::UnsafeRedirect: return "UNSAFE_REDIRECT";
    case NetError::EmptyResponse: return "EMPTY_RESPONSE";
    case NetError::InvalidHttpResponse: return "INVALID_HTTP_RESPONSE";
  }
  return "UNKNOWN";
}

} // namespace cw
