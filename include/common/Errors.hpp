#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace certmon::common {

/// Base error for all application-level exceptions.
/// Carries HTTP status code and machine-readable error code slug.
struct AppError : public std::runtime_error {
  int _iHttpStatus;
  std::string _sErrorCode;

  explicit AppError(int iHttpStatus, std::string sCode, std::string sMsg)
      : std::runtime_error(std::move(sMsg)),
        _iHttpStatus(iHttpStatus),
        _sErrorCode(std::move(sCode)) {}
};

/// 400 Bad Request: input validation failures (bad cron, bad filter, bad body).
struct ValidationError : AppError {
  explicit ValidationError(std::string sCode, std::string sMsg)
      : AppError(400, std::move(sCode), std::move(sMsg)) {}
};

/// 404 Not Found: requested host does not exist.
struct NotFoundError : AppError {
  explicit NotFoundError(std::string sCode, std::string sMsg)
      : AppError(404, std::move(sCode), std::move(sMsg)) {}
};

/// 409 Conflict: state conflict (e.g., a run of the same kind is in progress).
struct ConflictError : AppError {
  explicit ConflictError(std::string sCode, std::string sMsg)
      : AppError(409, std::move(sCode), std::move(sMsg)) {}
};

/// 422 Unprocessable Entity: template references an unknown field or is malformed.
struct TemplateError : AppError {
  explicit TemplateError(std::string sCode, std::string sMsg)
      : AppError(422, std::move(sCode), std::move(sMsg)) {}
};

/// 502 Bad Gateway: upstream DNS provider error.
struct ProviderError : AppError {
  explicit ProviderError(std::string sCode, std::string sMsg)
      : AppError(502, std::move(sCode), std::move(sMsg)) {}
};

/// 502 Bad Gateway: dial or TLS handshake failure. Converted to a host status
/// inside the prober; never escapes it.
struct ConnectionError : AppError {
  explicit ConnectionError(std::string sCode, std::string sMsg)
      : AppError(502, std::move(sCode), std::move(sMsg)) {}
};

/// 502 Bad Gateway: WHOIS transport or parse failure.
struct RegistrationLookupError : AppError {
  explicit RegistrationLookupError(std::string sCode, std::string sMsg)
      : AppError(502, std::move(sCode), std::move(sMsg)) {}
};

/// 502 Bad Gateway: alert channel rejected or failed a send. Logged, never retried.
struct DeliveryError : AppError {
  explicit DeliveryError(std::string sCode, std::string sMsg)
      : AppError(502, std::move(sCode), std::move(sMsg)) {}
};

/// 503 Service Unavailable: safety valve tripped; the deletion pass was skipped.
struct ReconciliationAbortedError : AppError {
  explicit ReconciliationAbortedError(std::string sCode, std::string sMsg)
      : AppError(503, std::move(sCode), std::move(sMsg)) {}
};

}  // namespace certmon::common
