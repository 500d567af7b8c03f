#ifndef INVOICE_DOCUMENT_SOURCE_HPP
#define INVOICE_DOCUMENT_SOURCE_HPP

#include <string>

namespace invoice {

/**
 * @brief Document retrieval capability
 */
class DocumentSource {
public:
  virtual ~DocumentSource() = default;

  /**
   * @brief Retrieve the bytes of a document
   * @param location URL or local path
   * @throws DownloadError if the document cannot be retrieved
   */
  virtual std::string fetch(const std::string &location) = 0;
};

/**
 * @brief Reads local files and downloads http(s) URLs with curl
 */
class DefaultDocumentSource : public DocumentSource {
public:
  /**
   * @param timeoutSeconds Upper bound for one download
   */
  explicit DefaultDocumentSource(int timeoutSeconds = 20);

  std::string fetch(const std::string &location) override;

  static bool isRemote(const std::string &location);

private:
  std::string download(const std::string &url) const;
  std::string readFile(const std::string &path) const;

  int m_timeoutSeconds;
};

} // namespace invoice

#endif // INVOICE_DOCUMENT_SOURCE_HPP
