#include "InstanceId.h"

#include <uuid/uuid.h>
#include <unistd.h>
#include <limits.h>

namespace strata::core::util {

std::string generateUuid() {
    uuid_t uuid;
    uuid_generate_time(uuid);
    char uuid_str[37];
    uuid_unparse_lower(uuid, uuid_str);
    return std::string(uuid_str);
}

std::string generateInstanceId() {
    char host[HOST_NAME_MAX + 1] = {0};
    std::string hostname = "unknown";
    if (gethostname(host, sizeof(host) - 1) == 0 && host[0] != '\0') {
        hostname = host;
    }

    uuid_t uuid;
    uuid_generate_random(uuid);
    char uuid_str[37];
    uuid_unparse_lower(uuid, uuid_str);

    return hostname + "_" + std::to_string(getpid()) + "_" + std::string(uuid_str, 8);
}

} // namespace strata::core::util
