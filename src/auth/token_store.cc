#define MCPGATE_LOG_COMPONENT "auth.token"

#include "mcpgate/auth/token_store.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "mcpgate/logging/log_macros.h"

namespace mcpgate {
namespace auth {

TokenStore::TokenStore(const std::string& path) : path_(path) {}

std::optional<nlohmann::json> TokenStore::load() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::ifstream file(path_);
  if (!file.is_open()) {
    return std::nullopt;
  }
  auto token = nlohmann::json::parse(file, nullptr, false);
  if (token.is_discarded() || !token.is_object()) {
    MCPGATE_LOG(Warning, "Token file {} is not a JSON object", path_);
    return std::nullopt;
  }
  return token;
}

bool TokenStore::save(const nlohmann::json& token) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::string tmp_path = path_ + ".tmp";
  std::string content =
      token.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

  int fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC,
                  S_IRUSR | S_IWUSR);
  if (fd < 0) {
    MCPGATE_LOG(Error, "Cannot create {}: {}", tmp_path, std::strerror(errno));
    return false;
  }

  size_t written = 0;
  while (written < content.size()) {
    ssize_t n = ::write(fd, content.data() + written, content.size() - written);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      MCPGATE_LOG(Error, "Write to {} failed: {}", tmp_path,
                  std::strerror(errno));
      ::close(fd);
      ::unlink(tmp_path.c_str());
      return false;
    }
    written += static_cast<size_t>(n);
  }

  if (::fsync(fd) != 0 || ::close(fd) != 0) {
    MCPGATE_LOG(Error, "Flushing {} failed: {}", tmp_path,
                std::strerror(errno));
    ::unlink(tmp_path.c_str());
    return false;
  }

  if (std::rename(tmp_path.c_str(), path_.c_str()) != 0) {
    MCPGATE_LOG(Error, "Cannot replace {}: {}", path_, std::strerror(errno));
    ::unlink(tmp_path.c_str());
    return false;
  }

  MCPGATE_LOG(Info, "Stored provider token in {}", path_);
  return true;
}

std::optional<std::string> TokenStore::accessToken() const {
  auto token = load();
  if (!token) {
    return std::nullopt;
  }
  auto it = token->find("access_token");
  if (it == token->end() || !it->is_string() ||
      it->get<std::string>().empty()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}

nlohmann::json TokenStore::status() const {
  auto token = load();
  if (!token) {
    return {{"authenticated", false}};
  }
  return {{"authenticated", true},
          {"token_type", token->value("token_type", nlohmann::json("unknown"))},
          {"expires_in", token->value("expires_in", nlohmann::json("unknown"))}};
}

}  // namespace auth
}  // namespace mcpgate
