#pragma once

#include <ctime>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace pqxx {
    class row;
    class result;
}

namespace ql::types {

struct Link {
    uint64_t id{0};
    std::string short_code;
    std::string original_url;
    std::optional<std::string> qr_code_url;
    std::time_t created_at{std::time(nullptr)};

    Link() = default;
    Link(std::string shortCode, std::string originalUrl);

    explicit Link(const pqxx::row& row);
};

void to_json(nlohmann::json& j, const Link& link);
void to_json(nlohmann::json& j, const std::shared_ptr<Link>& link);
void to_json(nlohmann::json& j, const std::vector<std::shared_ptr<Link>>& links);

std::vector<std::shared_ptr<Link>> links_from_pq_res(const pqxx::result& res);

}
