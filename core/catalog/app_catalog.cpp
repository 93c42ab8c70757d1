#include "app_catalog.hpp"

#include <httplib.h>

#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>

#include "logging/logger.hpp"
#include "runtime/app_paths.hpp"

namespace statforge {
namespace catalog {

namespace {

constexpr int kConnectTimeoutSec = 10;
constexpr int kReadTimeoutSec = 30;

void append_utf8(uint32_t cp, std::string &out) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

// Expands the predefined entities and character references
bool decode_entities(const std::string &raw, std::string &out, std::string &error) {
    out.clear();
    size_t pos = 0;
    while (pos < raw.size()) {
        if (raw[pos] != '&') {
            out += raw[pos++];
            continue;
        }
        size_t semi = raw.find(';', pos);
        if (semi == std::string::npos) {
            error = "Unterminated entity reference";
            return false;
        }
        std::string entity = raw.substr(pos + 1, semi - pos - 1);
        pos = semi + 1;

        if (entity == "lt") {
            out += '<';
        } else if (entity == "gt") {
            out += '>';
        } else if (entity == "amp") {
            out += '&';
        } else if (entity == "quot") {
            out += '"';
        } else if (entity == "apos") {
            out += '\'';
        } else if (entity.size() > 1 && entity[0] == '#') {
            bool hex = entity[1] == 'x' || entity[1] == 'X';
            std::string digits = entity.substr(hex ? 2 : 1);
            if (digits.empty() || digits.size() > 8) {
                error = "Invalid character reference &" + entity + ";";
                return false;
            }
            uint32_t cp = 0;
            for (char c : digits) {
                int digit;
                if (std::isdigit(static_cast<unsigned char>(c))) {
                    digit = c - '0';
                } else if (hex && std::isxdigit(static_cast<unsigned char>(c))) {
                    digit = std::tolower(static_cast<unsigned char>(c)) - 'a' + 10;
                } else {
                    error = "Invalid character reference &" + entity + ";";
                    return false;
                }
                cp = cp * (hex ? 16 : 10) + static_cast<uint32_t>(digit);
            }
            if (cp == 0 || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
                error = "Character reference out of range &" + entity + ";";
                return false;
            }
            append_utf8(cp, out);
        } else {
            error = "Unknown entity &" + entity + ";";
            return false;
        }
    }
    return true;
}

// Minimal scanner for the flat <games><game/></games> document
class GameListScanner {
public:
    explicit GameListScanner(const std::string &text) : text_(text) {}

    bool parse(std::vector<CatalogEntry> &out, std::string &error) {
        skip_misc();

        std::string name;
        std::map<std::string, std::string> attributes;
        bool self_closing = false;
        if (!read_start_tag(name, attributes, self_closing, error)) {
            return false;
        }
        if (name != "games") {
            error = "Root element must be <games>, found <" + name + ">";
            return false;
        }

        std::vector<CatalogEntry> entries;
        if (!self_closing) {
            while (true) {
                skip_misc();
                if (at_end()) {
                    error = "Unterminated <games> element";
                    return false;
                }
                if (starts_with("</")) {
                    if (!read_end_tag("games", error)) {
                        return false;
                    }
                    break;
                }
                CatalogEntry entry;
                if (!read_game(entry, error)) {
                    return false;
                }
                entries.push_back(entry);
            }
        }

        skip_misc();
        if (!at_end()) {
            error = "Unexpected content after </games> at offset " + std::to_string(pos_);
            return false;
        }
        out = std::move(entries);
        return true;
    }

private:
    bool at_end() const { return pos_ >= text_.size(); }

    bool starts_with(const char *prefix) const { return text_.compare(pos_, std::strlen(prefix), prefix) == 0; }

    void skip_whitespace() {
        while (!at_end() && std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
    }

    bool skip_until(const char *terminator) {
        size_t found = text_.find(terminator, pos_);
        if (found == std::string::npos) {
            pos_ = text_.size();
            return false;
        }
        pos_ = found + std::strlen(terminator);
        return true;
    }

    // Whitespace, declarations, comments and doctype
    void skip_misc() {
        while (true) {
            skip_whitespace();
            if (starts_with("<?")) {
                skip_until("?>");
            } else if (starts_with("<!--")) {
                skip_until("-->");
            } else if (starts_with("<!")) {
                skip_until(">");
            } else {
                return;
            }
        }
    }

    bool read_name(std::string &name) {
        size_t start = pos_;
        while (!at_end()) {
            char c = text_[pos_];
            if (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == ':' || c == '.') {
                ++pos_;
            } else {
                break;
            }
        }
        name = text_.substr(start, pos_ - start);
        return !name.empty();
    }

    bool read_start_tag(std::string &name, std::map<std::string, std::string> &attributes, bool &self_closing,
                        std::string &error) {
        if (at_end() || text_[pos_] != '<') {
            error = "Expected '<' at offset " + std::to_string(pos_);
            return false;
        }
        ++pos_;
        if (!read_name(name)) {
            error = "Expected element name at offset " + std::to_string(pos_);
            return false;
        }

        while (true) {
            skip_whitespace();
            if (at_end()) {
                error = "Unterminated start tag <" + name + ">";
                return false;
            }
            if (starts_with("/>")) {
                pos_ += 2;
                self_closing = true;
                return true;
            }
            if (text_[pos_] == '>') {
                ++pos_;
                self_closing = false;
                return true;
            }

            std::string attribute;
            if (!read_name(attribute)) {
                error = "Malformed attribute in <" + name + "> at offset " + std::to_string(pos_);
                return false;
            }
            skip_whitespace();
            if (at_end() || text_[pos_] != '=') {
                error = "Attribute '" + attribute + "' has no value";
                return false;
            }
            ++pos_;
            skip_whitespace();
            if (at_end() || (text_[pos_] != '"' && text_[pos_] != '\'')) {
                error = "Attribute '" + attribute + "' value must be quoted";
                return false;
            }
            char quote = text_[pos_++];
            size_t close = text_.find(quote, pos_);
            if (close == std::string::npos) {
                error = "Unterminated value of attribute '" + attribute + "'";
                return false;
            }
            std::string value;
            if (!decode_entities(text_.substr(pos_, close - pos_), value, error)) {
                return false;
            }
            attributes[attribute] = value;
            pos_ = close + 1;
        }
    }

    // Character data up to the closing tag: text, CDATA sections and comments
    bool read_text_content(std::string &out, std::string &error) {
        out.clear();
        while (true) {
            if (at_end()) {
                error = "Unterminated element at offset " + std::to_string(pos_);
                return false;
            }
            if (starts_with("</")) {
                return true;
            }
            if (starts_with("<![CDATA[")) {
                pos_ += 9;
                size_t close = text_.find("]]>", pos_);
                if (close == std::string::npos) {
                    error = "Unterminated CDATA section";
                    return false;
                }
                out += text_.substr(pos_, close - pos_);
                pos_ = close + 3;
                continue;
            }
            if (starts_with("<!--")) {
                if (!skip_until("-->")) {
                    error = "Unterminated comment";
                    return false;
                }
                continue;
            }
            if (text_[pos_] == '<') {
                error = "Nested markup at offset " + std::to_string(pos_);
                return false;
            }

            size_t next = text_.find('<', pos_);
            if (next == std::string::npos) {
                next = text_.size();
            }
            std::string decoded;
            if (!decode_entities(text_.substr(pos_, next - pos_), decoded, error)) {
                return false;
            }
            out += decoded;
            pos_ = next;
        }
    }

    bool read_end_tag(const std::string &expected, std::string &error) {
        pos_ += 2;  // "</"
        std::string name;
        read_name(name);
        skip_whitespace();
        if (name != expected || at_end() || text_[pos_] != '>') {
            error = "Expected </" + expected + "> at offset " + std::to_string(pos_);
            return false;
        }
        ++pos_;
        return true;
    }

    bool read_game(CatalogEntry &entry, std::string &error) {
        std::string name;
        std::map<std::string, std::string> attributes;
        bool self_closing = false;
        if (!read_start_tag(name, attributes, self_closing, error)) {
            return false;
        }
        if (name != "game") {
            error = "Unexpected element <" + name + "> inside <games>";
            return false;
        }
        if (self_closing) {
            error = "<game> element without an app id";
            return false;
        }

        std::string id_text;
        if (!read_text_content(id_text, error) || !read_end_tag("game", error)) {
            return false;
        }

        size_t first = id_text.find_first_not_of(" \t\r\n");
        size_t last = id_text.find_last_not_of(" \t\r\n");
        if (first == std::string::npos) {
            error = "<game> element without an app id";
            return false;
        }
        id_text = id_text.substr(first, last - first + 1);

        uint64_t id = 0;
        for (char c : id_text) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                error = "Invalid app id '" + id_text + "'";
                return false;
            }
            id = id * 10 + static_cast<uint64_t>(c - '0');
            if (id > UINT32_MAX) {
                error = "App id out of range: " + id_text;
                return false;
            }
        }
        entry.app_id = static_cast<uint32_t>(id);

        auto type = attributes.find("type");
        if (type == attributes.end()) {
            entry.app_type = AppType::APP;
        } else {
            auto parsed = app_type_from_string(type->second);
            if (!parsed) {
                error = "'" + type->second + "' is not a valid app type";
                return false;
            }
            entry.app_type = *parsed;
        }
        return true;
    }

    const std::string &text_;
    size_t pos_ = 0;
};

}  // namespace

bool parse_game_list(const std::string &xml, std::vector<CatalogEntry> &out, std::string &error) {
    GameListScanner scanner(xml);
    return scanner.parse(out, error);
}

bool split_url(const std::string &url, std::string &scheme_host_port, std::string &path, std::string &error) {
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        error = "URL has no scheme: " + url;
        return false;
    }
    std::string scheme = url.substr(0, scheme_end);
    if (scheme != "http" && scheme != "https") {
        error = "Unsupported URL scheme: " + scheme;
        return false;
    }
    size_t host_start = scheme_end + 3;
    size_t path_start = url.find_first_of("/?", host_start);
    if (path_start == host_start || host_start >= url.size()) {
        error = "URL has no host: " + url;
        return false;
    }
    if (path_start == std::string::npos) {
        scheme_host_port = url;
        path = "/";
    } else {
        scheme_host_port = url.substr(0, path_start);
        path = url.substr(path_start);
        if (path[0] == '?') {
            path.insert(path.begin(), '/');
        }
    }
    return true;
}

AppCatalog::AppCatalog(CatalogOptions options) : options_(std::move(options)) {
    if (options_.cache_path.empty()) {
        options_.cache_path = (runtime::cache_dir() / "apps.xml").string();
    }
}

bool AppCatalog::cache_is_fresh() const {
    std::error_code ec;
    auto modified = std::filesystem::last_write_time(options_.cache_path, ec);
    if (ec) {
        return false;
    }
    auto age = std::filesystem::file_time_type::clock::now() - modified;
    return age < std::chrono::hours(options_.max_age_hours);
}

bool AppCatalog::read_cache(std::string &body, std::string &error) const {
    std::ifstream file(options_.cache_path, std::ios::binary);
    if (!file) {
        error = "Cannot open app list cache " + options_.cache_path;
        return false;
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        error = "Cannot read app list cache " + options_.cache_path;
        return false;
    }
    body = buffer.str();
    return true;
}

bool AppCatalog::write_cache(const std::string &body, std::string &error) const {
    std::error_code ec;
    auto parent = std::filesystem::path(options_.cache_path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
    }
    std::ofstream file(options_.cache_path, std::ios::binary | std::ios::trunc);
    if (!file) {
        error = "Cannot write app list cache " + options_.cache_path;
        return false;
    }
    file << body;
    file.flush();
    if (!file) {
        error = "Cannot write app list cache " + options_.cache_path;
        return false;
    }
    return true;
}

bool AppCatalog::download(std::string &body, std::string &error) {
    std::string host;
    std::string path;
    if (!split_url(options_.url, host, path, error)) {
        return false;
    }

    LOG_INFO("[Catalog] Downloading app list from " << options_.url);
    httplib::Client client(host);
    client.set_follow_location(true);
    client.set_connection_timeout(kConnectTimeoutSec, 0);
    client.set_read_timeout(kReadTimeoutSec, 0);

    auto result = client.Get(path);
    if (!result) {
        error = "Download failed: " + httplib::to_string(result.error());
        return false;
    }
    if (result->status != 200) {
        error = "Download failed: HTTP " + std::to_string(result->status);
        return false;
    }
    body = result->body;
    return true;
}

bool AppCatalog::load_entries(std::vector<CatalogEntry> &out, std::string &error) {
    std::string body;
    if (cache_is_fresh()) {
        LOG_DEBUG("[Catalog] Loading app list from " << options_.cache_path);
        if (!read_cache(body, error)) {
            return false;
        }
        return parse_game_list(body, out, error);
    }

    if (!download(body, error)) {
        return false;
    }
    if (!parse_game_list(body, out, error)) {
        return false;
    }
    LOG_INFO("[Catalog] App list loaded (" << out.size() << " entries), saving to " << options_.cache_path);
    return write_cache(body, error);
}

std::optional<std::string> AppCatalog::image_url(uint32_t app_id) {
    auto banner = runtime::local_banner_path(app_id);
    if (!banner) {
        return std::nullopt;
    }
    return "file://" + banner->string();
}

ipc::Response<std::vector<AppModel>> AppCatalog::owned_apps(native::IClientSession &session) {
    std::vector<CatalogEntry> entries;
    std::string error;
    if (!load_entries(entries, error)) {
        LOG_ERROR("[Catalog] " << error);
        return ipc::Response<std::vector<AppModel>>::error(ipc::ErrorKind::APP_LIST_RETRIEVAL_FAILED);
    }

    std::vector<AppModel> apps;
    for (const auto &entry : entries) {
        if (!session.is_subscribed(entry.app_id)) {
            continue;
        }
        AppModel app;
        app.app_id = entry.app_id;
        app.app_type = entry.app_type;
        app.app_name = session.app_name(entry.app_id).value_or("App " + std::to_string(entry.app_id));
        app.image_url = image_url(entry.app_id);
        apps.push_back(std::move(app));
    }

    LOG_INFO("[Catalog] " << apps.size() << " of " << entries.size() << " listed apps are owned");
    return ipc::Response<std::vector<AppModel>>::success(std::move(apps));
}

}  // namespace catalog
}  // namespace statforge
