#include <scriptor/search_client.h>
#include <scriptor/client.h>
#include <scriptor/environment.h>
#include <scriptor/exceptions.h>
#include <scriptor/logger.h>
#include <cctype>
#include <cstdio>
#include <regex>
#include <vector>

namespace scriptor {

namespace {

constexpr const char* kDefaultDateUpper = "20220101";

void replace_all(std::string& text, std::string_view from, std::string_view to) {
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}

bool is_leap(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

bool valid_date(int year, int month, int day) {
    static const int days_in_month[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (year < 1 || month < 1 || month > 12 || day < 1) return false;
    const int limit = days_in_month[month - 1] + (month == 2 && is_leap(year) ? 1 : 0);
    return day <= limit;
}

std::string format_date(int year, int month, int day) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d%02d%02d", year, month, day);
    return buf;
}

// Copy of obj[key], or `fallback` when the key is absent.
boost::json::value get_or(const boost::json::object& obj, boost::json::string_view key,
                          boost::json::value fallback = boost::json::string()) {
    if (const auto* v = obj.if_contains(key)) {
        return *v;
    }
    return fallback;
}

std::string_view view_of(const boost::json::string& s) {
    return std::string_view(s.data(), s.size());
}

std::string clean(const boost::json::value* v) {
    if (!v || !v->is_string()) {
        return "";
    }
    return strip_html(view_of(v->as_string()));
}

// Non-empty array under `key`, else nullptr.
const boost::json::array* non_empty_array(const boost::json::object& obj, boost::json::string_view key) {
    const auto* v = obj.if_contains(key);
    if (!v || !v->is_array() || v->as_array().empty()) {
        return nullptr;
    }
    return &v->as_array();
}

std::int64_t count_value(const boost::json::value* v) {
    if (!v) return 0;
    if (v->is_int64()) return v->as_int64();
    if (v->is_string()) {
        const auto& s = v->as_string();
        if (s.empty()) return 0;
        for (char c : s) {
            if (!std::isdigit(static_cast<unsigned char>(c))) return 0;
        }
        return std::stoll(std::string(s.data(), s.size()));
    }
    return 0;
}

boost::json::object reshape_item(const boost::json::object& item) {
    boost::json::object out;

    if (const auto* metadata = item.if_contains("metadata"); metadata && metadata->is_array()) {
        for (const auto& entry : metadata->as_array()) {
            const auto* meta = entry.if_object();
            if (!meta) continue;
            const auto* name = meta->if_contains("name");
            if (!name || !name->is_string()) continue;

            const auto* value = meta->if_contains("value");
            const std::string_view field = view_of(name->as_string());

            if (field == "YE") {
                out["PublicationYear"] = (value && value->is_string()) ? *value : boost::json::value("");
            } else if (field == "TI") {
                out["Title"] = clean(value);
            } else if (field == "KY") {
                out["KeyWords"] = clean(value);
            } else if (field == "AB") {
                out["Abstract"] = clean(value);
            } else if (field == "LY") {
                out["Journal"] = clean(value);
            } else if (field == "DB") {
                out["Database"] = value ? *value : boost::json::value(nullptr);
            }
        }
    }

    if (const auto* authors = non_empty_array(item, "authors")) {
        boost::json::array list;
        for (const auto& a : *authors) {
            const auto* author = a.if_object();
            if (!author) continue;
            list.push_back(boost::json::object{
                {"name", get_or(*author, "title")},
                {"id", get_or(*author, "id")},
                {"corresponding", get_or(*author, "corresponding", false)}
            });
        }
        if (!list.empty()) {
            out["FirstAuthor"] = list.front().as_object().at("name");
        }
        out["Authors"] = std::move(list);
    }

    if (const auto* affiliations = non_empty_array(item, "affiliations")) {
        boost::json::array list;
        for (const auto& a : *affiliations) {
            if (const auto* aff = a.if_object()) {
                list.push_back(boost::json::object{
                    {"id", get_or(*aff, "id")},
                    {"name", get_or(*aff, "title")}
                });
            }
        }
        out["Affiliations"] = std::move(list);
    }

    if (const auto* indexes = non_empty_array(item, "indexes")) {
        boost::json::array list;
        for (const auto& i : *indexes) {
            if (const auto* index = i.if_object()) {
                list.push_back(boost::json::object{
                    {"name", get_or(*index, "name")},
                    {"description", get_or(*index, "value")}
                });
            }
        }
        out["CoreJournalIndexes"] = std::move(list);
    }

    if (const auto* source = item.if_contains("source"); source && source->is_object()) {
        const auto& src = source->as_object();
        out["Source"] = boost::json::object{
            {"type", get_or(src, "type")},
            {"title", get_or(src, "title")},
            {"year", get_or(src, "year")},
            {"volume", get_or(src, "volume")},
            {"issue", get_or(src, "issue")}
        };
    }

    if (const auto* funds = non_empty_array(item, "funds")) {
        boost::json::array list;
        for (const auto& f : *funds) {
            if (const auto* fund = f.if_object()) {
                list.push_back(boost::json::object{{"title", get_or(*fund, "title")}});
            }
        }
        out["Funds"] = std::move(list);
    }

    if (const auto* keywords = non_empty_array(item, "keywords")) {
        boost::json::array detailed;
        for (const auto& g : *keywords) {
            const auto* group = g.if_object();
            if (!group) continue;
            const auto* items = group->if_contains("items");
            if (!items || !items->is_array()) continue;
            for (const auto& k : items->as_array()) {
                if (const auto* kw = k.if_object()) {
                    detailed.push_back(boost::json::value(clean(kw->if_contains("item"))));
                }
            }
        }
        if (!detailed.empty()) {
            out["DetailedKeywords"] = std::move(detailed);
        }
    }

    if (const auto* metrics = non_empty_array(item, "metrics")) {
        boost::json::object counts;
        for (const auto& m : *metrics) {
            const auto* metric = m.if_object();
            if (!metric) continue;
            const auto* name = metric->if_contains("name");
            if (!name || !name->is_string()) continue;

            const std::string_view metric_name = view_of(name->as_string());
            if (metric_name == "DTC") {
                counts["download_count"] = count_value(metric->if_contains("value"));
            } else if (metric_name == "CTC") {
                counts["citation_count"] = count_value(metric->if_contains("value"));
            }
        }
        out["Metrics"] = std::move(counts);
    }

    if (const auto* publishing = item.if_contains("publishing"); publishing && publishing->is_object()) {
        const auto& pub = publishing->as_object();
        out["Publishing"] = boost::json::object{
            {"status", get_or(pub, "status")},
            {"modes", get_or(pub, "modes", boost::json::array())}
        };
    }

    if (const auto* repository = item.if_contains("repository"); repository && repository->is_object()) {
        const auto& repo = repository->as_object();
        out["Repository"] = boost::json::object{
            {"resource", get_or(repo, "resource")},
            {"dataset", get_or(repo, "dataset")},
            {"type", get_or(repo, "type")},
            {"subject_category_1", get_or(repo, "ccl1")},
            {"subject_category_2", get_or(repo, "ccl2")}
        };
    }

    return out;
}

}

SearchConfig SearchConfig::from_env() {
    SearchConfig cfg;
    cfg.search_url = env<std::string>("SEARCH_API_URL", "");
    cfg.oauth_url = env<std::string>("SEARCH_OAUTH_URL", "");
    cfg.uniplatform = env<std::string>("SEARCH_UNIPLATFORM", cfg.uniplatform);
    cfg.access_token = env<std::string>("SEARCH_ACCESS_TOKEN", "");
    cfg.client_id = env<std::string>("SEARCH_CLIENT_ID", "");
    cfg.client_secret = env<std::string>("SEARCH_CLIENT_SECRET", "");
    cfg.max_clients = env<size_t>("SEARCH_MAX_CLIENTS", cfg.max_clients);
    return cfg;
}

std::string_view product_codes(SearchLanguage language) {
    if (language == SearchLanguage::English) {
        return "WWJD,WWPD";
    }
    return "CJFD,CDFD,CMFD,CPFD,CCND,IPFD,CAPJ";
}

HttpSearchClient::HttpSearchClient(SearchConfig config) : config_(std::move(config)) {
    if (config_.search_url.empty()) {
        throw ConfigurationError("Search endpoint is not set (SEARCH_API_URL)");
    }
}

boost::json::object HttpSearchClient::build_request(const SearchQuery& query) {
    std::optional<std::string> upper;
    if (query.date_upper) {
        upper = normalize_date_upper(*query.date_upper);
    }

    return boost::json::object{
        {"resource", "CROSSDB"},
        {"product", std::string(product_codes(query.language))},
        {"extend", 1},
        {"start", 1},
        {"size", 50},
        {"sort", "PT"},
        {"sequence", "DESC"},
        {"select", "TI,AB,KY,DB,LY,YE,PT"},
        {"q", boost::json::object{
            {"logic", "AND"},
            {"items", boost::json::array{
                boost::json::object{
                    {"logic", "AND"},
                    {"operator", ""},
                    {"uf", "EXPERT"},
                    {"uv", query.expression}
                },
                boost::json::object{
                    {"logic", "AND"},
                    {"operator", "LE"},
                    {"uf", "PT"},
                    {"uv", upper.value_or(kDefaultDateUpper)}
                }
            }},
            {"childItems", boost::json::array()}
        }}
    };
}

std::optional<boost::json::object> HttpSearchClient::search(const SearchQuery& query) {
    auto& log = Logger::instance();

    Headers headers{
        {"uniplatform", config_.uniplatform},
        {"language", "CHS"},
        {"Content-Type", "application/json"},
        {"Authorization", "Bearer " + config_.access_token}
    };

    try {
        auto res = fetch_json_sync(config_.search_url, "POST", std::move(headers),
                                   build_request(query), config_.timeout);
        if (!res.ok()) {
            log.log_error("Search returned HTTP " + std::to_string(res.status) + ": " + res.body.substr(0, 200));
            return std::nullopt;
        }

        boost::system::error_code ec;
        auto body = boost::json::parse(res.body, ec);
        if (ec || !body.is_object()) {
            log.log_error("Search returned a non-JSON body: " + res.body.substr(0, 200));
            return std::nullopt;
        }
        return reshape_search_results(body.as_object());
    } catch (const std::exception& e) {
        log.log_error(std::string("Search request failed: ") + e.what());
        return std::nullopt;
    }
}

boost::json::object reshape_search_results(const boost::json::object& raw) {
    boost::json::value total = nullptr;
    boost::json::value size = nullptr;
    boost::json::array items;

    if (const auto* data = raw.if_contains("data"); data && data->is_object()) {
        const auto& d = data->as_object();
        total = get_or(d, "total", nullptr);
        size = get_or(d, "size", nullptr);

        if (const auto* records = d.if_contains("data"); records && records->is_array()) {
            for (const auto& record : records->as_array()) {
                if (const auto* item = record.if_object()) {
                    items.push_back(reshape_item(*item));
                }
            }
        }
    }

    return boost::json::object{
        {"code", get_or(raw, "code", nullptr)},
        {"message", get_or(raw, "message", nullptr)},
        {"searchResultsCollections", boost::json::object{
            {"total", std::move(total)},
            {"size", std::move(size)},
            {"items", std::move(items)}
        }}
    };
}

std::string strip_html(std::string_view text) {
    static const std::regex tag("<.*?>");
    return std::regex_replace(std::string(text), tag, "");
}

std::optional<std::string> normalize_date_upper(std::string_view text) {
    static const std::regex remarks("（.*?）|\\(.*?\\)");
    static const std::regex whitespace("\\s+");

    std::string chunk = std::regex_replace(std::string(text), remarks, "");
    replace_all(chunk, "年", "-");
    replace_all(chunk, "月", "-");
    replace_all(chunk, "日", "");
    replace_all(chunk, "．", "-");
    replace_all(chunk, "/", "-");
    replace_all(chunk, ".", "-");
    chunk = std::regex_replace(chunk, whitespace, "");
    if (chunk.empty()) {
        return std::nullopt;
    }

    std::string compact = chunk;
    replace_all(compact, "-", "");

    // Same shapes and field widths a strptime parse would accept.
    static const std::string month = "(1[0-2]|0[1-9]|[1-9])";
    static const std::string day = "(3[01]|[12][0-9]|0[1-9]|[1-9])";
    static const std::regex formats[] = {
        std::regex("^([0-9]{4})-" + month + "-" + day + "$"),
        std::regex("^([0-9]{4})" + month + day + "$"),
        std::regex("^([0-9]{4})-" + month + "$"),
        std::regex("^([0-9]{4})" + month + "$"),
    };

    for (const std::string* candidate : {&chunk, &compact}) {
        for (const auto& format : formats) {
            std::smatch m;
            if (!std::regex_match(*candidate, m, format)) continue;

            const int year = std::stoi(m[1].str());
            const int mon = std::stoi(m[2].str());
            const int d = m.size() > 3 && m[3].matched ? std::stoi(m[3].str()) : 1;
            if (valid_date(year, mon, d)) {
                return format_date(year, mon, d);
            }
        }
    }

    static const std::regex loose("([0-9]{4})([0-9]{1,2})([0-9]{1,2})");
    std::smatch m;
    if (std::regex_search(chunk, m, loose)) {
        return format_date(std::stoi(m[1].str()), std::stoi(m[2].str()), std::stoi(m[3].str()));
    }
    return std::nullopt;
}

std::optional<boost::json::object> fetch_access_token(const std::string& oauth_url,
                                                      const std::string& client_id,
                                                      const std::string& client_secret,
                                                      std::chrono::milliseconds timeout) {
    if (oauth_url.empty()) {
        throw ConfigurationError("OAuth endpoint is not set (SEARCH_OAUTH_URL)");
    }

    auto& log = Logger::instance();
    const std::string body = form_encode({
        {"client_id", client_id},
        {"client_secret", client_secret},
        {"grant_type", "client_credentials"}
    });

    try {
        auto res = fetch_sync(oauth_url, "POST",
                              {{"Content-Type", "application/x-www-form-urlencoded"}}, body, timeout);
        if (!res.ok()) {
            log.log_error("Token request returned HTTP " + std::to_string(res.status) + ": " +
                          res.body.substr(0, 200));
            return std::nullopt;
        }

        boost::system::error_code ec;
        auto token = boost::json::parse(res.body, ec);
        if (ec || !token.is_object()) {
            log.log_error("Token response is not a JSON object: " + res.body.substr(0, 200));
            return std::nullopt;
        }
        return token.as_object();
    } catch (const std::exception& e) {
        log.log_error(std::string("Token request failed: ") + e.what());
        return std::nullopt;
    }
}

} // namespace scriptor
