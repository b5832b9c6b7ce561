#include "types/Link.hpp"
#include "util/timestamp.hpp"

#include <pqxx/row>
#include <pqxx/result>
#include <nlohmann/json.hpp>

using namespace ql::types;

Link::Link(std::string shortCode, std::string originalUrl)
    : short_code(std::move(shortCode)),
      original_url(std::move(originalUrl)) {}

Link::Link(const pqxx::row& row)
    : id(row["id"].as<uint64_t>()),
      short_code(row["short_code"].as<std::string>()),
      original_url(row["original_url"].as<std::string>()),
      created_at(util::parsePostgresTimestamp(row["created_at"].as<std::string>())) {
    if (!row["qr_code_url"].is_null()) qr_code_url = row["qr_code_url"].as<std::string>();
}

void ql::types::to_json(nlohmann::json& j, const Link& link) {
    j = nlohmann::json{
        {"short_code", link.short_code},
        {"original_url", link.original_url},
        {"qr_code_url", link.qr_code_url ? nlohmann::json(*link.qr_code_url) : nlohmann::json(nullptr)},
        {"created_at", util::timestampToString(link.created_at)}
    };
}

void ql::types::to_json(nlohmann::json& j, const std::shared_ptr<Link>& link) {
    to_json(j, *link);
}

void ql::types::to_json(nlohmann::json& j, const std::vector<std::shared_ptr<Link>>& links) {
    j = nlohmann::json::array();
    for (const auto& link : links) j.push_back(link);
}

std::vector<std::shared_ptr<Link>> ql::types::links_from_pq_res(const pqxx::result& res) {
    std::vector<std::shared_ptr<Link>> links;
    links.reserve(res.size());
    for (const auto& row : res) links.push_back(std::make_shared<Link>(row));
    return links;
}
