#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "i_app_catalog.hpp"

namespace statforge {
namespace catalog {

// One <game> element of the published list
struct CatalogEntry {
    uint32_t app_id = 0;
    AppType app_type = AppType::APP;
};

struct CatalogOptions {
    std::string url;         // remote list
    std::string cache_path;  // local copy of the list
    int max_age_hours = 168;
};

/**
 * @brief Parses the published game list.
 *
 * Expects `<games>` holding `<game type="...">app_id</game>` elements. A
 * missing type attribute means App. Fails on malformed markup, on an app id
 * that is not a u32 and on an unknown type.
 */
bool parse_game_list(const std::string &xml, std::vector<CatalogEntry> &out, std::string &error);

// Splits "https://host:port/path?q" into "https://host:port" and "/path?q"
bool split_url(const std::string &url, std::string &scheme_host_port, std::string &path, std::string &error);

/**
 * @brief App catalog backed by a downloaded XML list.
 *
 * The list is fetched from the configured URL when the cache file is missing
 * or older than max_age_hours, and only written to the cache once it parses.
 * Entries are filtered by the session's ownership check; names come from the
 * session and banners from the local Steam installation.
 */
class AppCatalog : public IAppCatalog {
public:
    explicit AppCatalog(CatalogOptions options);

    ipc::Response<std::vector<AppModel>> owned_apps(native::IClientSession &session) override;

    // Cache or remote, whichever is current
    bool load_entries(std::vector<CatalogEntry> &out, std::string &error);

    bool cache_is_fresh() const;

    const CatalogOptions &options() const { return options_; }

protected:
    // Seam for tests: fetches the raw list body
    virtual bool download(std::string &body, std::string &error);

    // Header image of the app, if one is available locally
    virtual std::optional<std::string> image_url(uint32_t app_id);

private:
    bool read_cache(std::string &body, std::string &error) const;
    bool write_cache(const std::string &body, std::string &error) const;

    CatalogOptions options_;
};

}  // namespace catalog
}  // namespace statforge
