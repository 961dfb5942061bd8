#include "modules_dl.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>

#include <httplib.h>
#include <spdlog/spdlog.h>

#include "process.hpp"

const char *const kReleasesUrl =
    "https://gist.githubusercontent.com/0xbrayo/f7b25a2ff9ed24ce21fa8397837265b6/raw/"
    "120ddb3d31d7f009d66f070bd4a0dc06d3c0aacf/aw-releases.csv";

namespace {
constexpr std::size_t kReleaseFields = 7;

// ─────────────────────────────────────
std::vector<std::string> SplitRow(const std::string &line) {
    std::vector<std::string> fields;
    std::string field;
    std::istringstream ss(line);
    while (std::getline(ss, field, ',')) {
        fields.push_back(field);
    }
    // getline drops a trailing empty field
    if (!line.empty() && line.back() == ',') {
        fields.emplace_back();
    }
    return fields;
}

// ─────────────────────────────────────
// "https://host[:port]/path" -> {"https://host[:port]", "/path"}
std::pair<std::string, std::string> SplitUrl(const std::string &url) {
    const auto scheme = url.find("://");
    if (scheme == std::string::npos) {
        throw DownloadError("Invalid URL: " + url);
    }
    const auto slash = url.find('/', scheme + 3);
    if (slash == std::string::npos) {
        return {url, "/"};
    }
    return {url.substr(0, slash), url.substr(slash)};
}

// ─────────────────────────────────────
std::string Fetch(const std::string &url) {
    const auto [base, path] = SplitUrl(url);
    httplib::Client client(base);
    client.set_follow_location(true);
    client.set_connection_timeout(10, 0);
    client.set_read_timeout(60, 0);

    auto res = client.Get(path);
    if (!res) {
        throw DownloadError("Request to " + url + " failed: " + httplib::to_string(res.error()));
    }
    if (res->status < 200 || res->status >= 300) {
        throw DownloadError("Request to " + url + " failed: HTTP " + std::to_string(res->status));
    }
    return res->body;
}

// ─────────────────────────────────────
void Extract(const std::filesystem::path &archive, const std::filesystem::path &dest) {
    const std::string file = archive.filename().string();
    auto endsWith = [&file](const std::string &suffix) {
        return file.size() >= suffix.size() &&
               file.compare(file.size() - suffix.size(), suffix.size(), suffix) == 0;
    };

    std::string tool;
    std::vector<std::string> args;
    if (endsWith(".zip")) {
        tool = "unzip";
        args = {"-o", archive.string(), "-d", dest.string()};
    } else if (endsWith(".tar") || endsWith(".tar.gz")) {
        tool = "tar";
        args = {"-xvf", archive.string(), "-C", dest.string()};
    } else {
        spdlog::info("{} is not an archive, leaving it as is", file);
        return;
    }

    try {
        ChildProcess child(tool, args);
        ExitInfo info = child.Wait();
        if (!info.Success()) {
            throw DownloadError(tool + " failed on " + file + " (" + info.Describe() + "): " +
                                info.output);
        }
        spdlog::debug("{} output:\n{}", tool, info.output);
    } catch (const ProcessError &e) {
        throw DownloadError(e.what());
    }
}
} // namespace

// ─────────────────────────────────────
std::vector<ReleaseEntry> ParseReleases(const std::string &text) {
    std::vector<ReleaseEntry> entries;
    std::istringstream in(text);
    std::string line;
    int lineNo = 0;
    bool header = true;

    while (std::getline(in, line)) {
        ++lineNo;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }
        if (header) {
            header = false;
            continue;
        }

        const auto fields = SplitRow(line);
        if (fields.size() < kReleaseFields) {
            throw DownloadError("Malformed releases file: line " + std::to_string(lineNo) +
                                " has " + std::to_string(fields.size()) + " fields");
        }

        ReleaseEntry entry;
        entry.name = fields[0];
        entry.os = fields[1];
        entry.display_server = fields[2];
        entry.version = fields[3];
        entry.arch = fields[4];
        entry.release_date = fields[5];
        entry.link = fields[6];
        entries.push_back(std::move(entry));
    }
    return entries;
}

// ─────────────────────────────────────
std::vector<ReleaseEntry> SelectReleases(const std::vector<ReleaseEntry> &entries,
                                         const std::string &os, const std::string &display_server) {
    std::vector<ReleaseEntry> selected;
    for (const auto &entry : entries) {
        if (entry.os != os) {
            continue;
        }
        if (!entry.display_server.empty() && entry.display_server != display_server) {
            continue;
        }
        selected.push_back(entry);
    }
    return selected;
}

// ─────────────────────────────────────
bool IsWayland() {
    const char *session = std::getenv("XDG_SESSION_TYPE");
    return session && std::string(session) == "wayland";
}

// ─────────────────────────────────────
bool HasEssentialModules(const std::set<std::string> &names, bool wayland) {
    const std::vector<std::string> essential =
        wayland ? std::vector<std::string>{"aw-awatcher"}
                : std::vector<std::string>{"aw-watcher-afk", "aw-watcher-window"};
    for (const auto &name : essential) {
        if (names.count(name) == 0) {
            return false;
        }
    }
    return true;
}

// ─────────────────────────────────────
void DownloadModules(const std::filesystem::path &discovery_path, const std::string &releases_url) {
    std::error_code ec;
    std::filesystem::create_directories(discovery_path, ec);
    if (ec) {
        throw DownloadError("Unable to create " + discovery_path.string() + ": " + ec.message());
    }

    spdlog::info("Fetching module releases from {}", releases_url);
    const auto entries = ParseReleases(Fetch(releases_url));
    const auto selected = SelectReleases(entries, "linux", IsWayland() ? "wayland" : "x11");
    if (selected.empty()) {
        spdlog::warn("No module releases available for this system");
        return;
    }

    for (const auto &entry : selected) {
        const auto fileName = entry.link.substr(entry.link.find_last_of('/') + 1);
        if (fileName.empty()) {
            throw DownloadError("Release link for " + entry.name + " has no file name");
        }
        const auto target = discovery_path / fileName;

        spdlog::info("Downloading {} {} from {}", entry.name, entry.version, entry.link);
        const std::string body = Fetch(entry.link);

        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw DownloadError("Unable to write " + target.string());
        }
        out.write(body.data(), static_cast<std::streamsize>(body.size()));
        out.close();
        if (!out) {
            throw DownloadError("Failed writing " + target.string());
        }

        Extract(target, discovery_path);
        spdlog::info("Installed {} into {}", entry.name, discovery_path.string());
    }
}
