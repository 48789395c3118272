#include "host/Fqdn.hpp"
#include "util/Diag.hpp"

#include <netdb.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <climits>
#include <cstring>

namespace dockhand::host {

auto local_fqdn() -> std::string {
  char buf[HOST_NAME_MAX + 1]{};
  if (::gethostname(buf, sizeof(buf)) != 0) {
    util::diag("Fqdn", "gethostname: %s", std::strerror(errno));
    return "localhost";
  }
  buf[sizeof(buf) - 1] = '\0';
  std::string host(buf);

  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = AI_CANONNAME;
  addrinfo* res = nullptr;
  int rc = ::getaddrinfo(host.c_str(), nullptr, &hints, &res);
  if (rc != 0) {
    util::diag("Fqdn", "cannot resolve %s: %s", host.c_str(), ::gai_strerror(rc));
    return host;
  }
  std::string fqdn = host;
  for (auto* ai = res; ai; ai = ai->ai_next) {
    if (ai->ai_canonname && *ai->ai_canonname) { fqdn = ai->ai_canonname; break; }
  }
  ::freeaddrinfo(res);
  return fqdn;
}

} // namespace dockhand::host
