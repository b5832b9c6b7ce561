#pragma once

#include <string>

namespace ql::types {

struct S3Credentials {
    std::string endpoint;
    std::string region = "auto";
    std::string access_key;
    std::string secret_access_key;
};

}
