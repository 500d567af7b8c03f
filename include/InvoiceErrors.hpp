#ifndef INVOICE_ERRORS_HPP
#define INVOICE_ERRORS_HPP

#include "InvoiceTypes.hpp"

#include <stdexcept>
#include <string>

namespace invoice {

/**
 * @brief Fatal, document-level failure carrying its category
 */
class DocumentError : public std::runtime_error {
public:
  DocumentError(ErrorCategory category, const std::string &message)
      : std::runtime_error(message), m_category(category) {}

  ErrorCategory category() const { return m_category; }

private:
  ErrorCategory m_category;
};

/**
 * @brief The document bytes could not be retrieved
 */
class DownloadError : public DocumentError {
public:
  explicit DownloadError(const std::string &message)
      : DocumentError(ErrorCategory::Download, message) {}
};

/**
 * @brief The document could not be turned into page images
 */
class RenderError : public DocumentError {
public:
  enum class Reason {
    Unavailable,    ///< No rasterizer on this build / installation
    InvalidDocument ///< Bytes are not a readable document
  };

  RenderError(Reason reason, const std::string &message)
      : DocumentError(ErrorCategory::Render, message), m_reason(reason) {}

  Reason reason() const { return m_reason; }

private:
  Reason m_reason;
};

} // namespace invoice

#endif // INVOICE_ERRORS_HPP
