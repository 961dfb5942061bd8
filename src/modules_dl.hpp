#pragma once

#include <filesystem>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

class DownloadError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

// One row of the releases file: name,os,display_server,version,arch,release_date,link
struct ReleaseEntry {
    std::string name;
    std::string os;
    std::string display_server;
    std::string version;
    std::string arch;
    std::string release_date;
    std::string link;
};

extern const char *const kReleasesUrl;

// Parses the CSV (header row required). Throws DownloadError on rows with missing fields.
std::vector<ReleaseEntry> ParseReleases(const std::string &text);

// Rows for os whose display server is empty or matches.
std::vector<ReleaseEntry> SelectReleases(const std::vector<ReleaseEntry> &entries,
                                         const std::string &os, const std::string &display_server);

bool IsWayland();

// aw-awatcher on Wayland, aw-watcher-afk and aw-watcher-window elsewhere.
bool HasEssentialModules(const std::set<std::string> &names, bool wayland);

// Fetches the releases file and unpacks every matching module into discovery_path.
// Throws DownloadError on network or extraction failures.
void DownloadModules(const std::filesystem::path &discovery_path,
                     const std::string &releases_url = kReleasesUrl);
