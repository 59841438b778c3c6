#include "HostnameResolver.hpp"

#include <arpa/inet.h>
#include <cstring>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>

namespace whos_home::discovery
{
    std::optional<std::string> SystemHostnameResolver::Lookup(const std::string &ip)
    {
        struct sockaddr_in addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1)
            return std::nullopt;

        char host[NI_MAXHOST];
        int rc = getnameinfo(reinterpret_cast<struct sockaddr *>(&addr), sizeof(addr),
                             host, sizeof(host), nullptr, 0, NI_NAMEREQD);
        if (rc != 0)
            return std::nullopt;

        return std::string(host);
    }
}
