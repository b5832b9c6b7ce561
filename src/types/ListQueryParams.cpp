#include "types/ListQueryParams.hpp"
#include "util/parse.hpp"

using namespace ql::types;

ListQueryParams ListQueryParams::fromQuery(const std::unordered_map<std::string, std::string>& query) {
    ListQueryParams p;
    if (const auto it = query.find("limit"); it != query.end()) p.limit = util::parseInt64(it->second, "limit");
    if (const auto it = query.find("offset"); it != query.end()) p.offset = util::parseInt64(it->second, "offset");
    return p;
}
