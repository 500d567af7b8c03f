#include "DocumentSource.hpp"
#include "InvoiceErrors.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace invoice {

namespace {

bool commandExists(const std::string &command) {
  std::string test = "command -v " + command + " >/dev/null 2>&1";
  return std::system(test.c_str()) == 0;
}

// Single-quote a shell argument
std::string shellQuote(const std::string &value) {
  std::string quoted = "'";
  for (char c : value) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted += c;
    }
  }
  quoted += "'";
  return quoted;
}

} // anonymous namespace

DefaultDocumentSource::DefaultDocumentSource(int timeoutSeconds)
    : m_timeoutSeconds(timeoutSeconds) {}

bool DefaultDocumentSource::isRemote(const std::string &location) {
  std::string prefix = location.substr(0, 8);
  std::transform(prefix.begin(), prefix.end(), prefix.begin(), ::tolower);
  return prefix.rfind("http://", 0) == 0 || prefix.rfind("https://", 0) == 0;
}

std::string DefaultDocumentSource::fetch(const std::string &location) {
  if (location.empty()) {
    throw DownloadError("No document location given");
  }
  return isRemote(location) ? download(location) : readFile(location);
}

std::string DefaultDocumentSource::readFile(const std::string &path) const {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw DownloadError("Cannot open " + path);
  }
  std::ostringstream contents;
  contents << file.rdbuf();
  if (file.bad()) {
    throw DownloadError("Failed to read " + path);
  }
  return contents.str();
}

std::string DefaultDocumentSource::download(const std::string &url) const {
  if (!commandExists("curl")) {
    throw DownloadError("curl not found; cannot download " + url);
  }

  std::string cmd = "curl --fail --silent --show-error --location --max-time " +
                    std::to_string(m_timeoutSeconds) + " " + shellQuote(url) +
                    " 2>/dev/null";
  FILE *pipe = popen(cmd.c_str(), "r");
  if (!pipe) {
    throw DownloadError("Failed to run curl");
  }
  std::string out;
  char buf[8192];
  while (true) {
    size_t n = std::fread(buf, 1, sizeof(buf), pipe);
    if (n > 0)
      out.append(buf, n);
    if (n < sizeof(buf))
      break;
  }
  int rc = pclose(pipe);
  if (rc != 0) {
    throw DownloadError("Download failed for " + url);
  }
  if (out.empty()) {
    throw DownloadError("Downloaded document is empty");
  }
  return out;
}

} // namespace invoice
